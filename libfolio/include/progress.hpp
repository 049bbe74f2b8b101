//
// Created by Giuseppe Francione on 03/02/26.
//

#ifndef FOLIO_PROGRESS_HPP
#define FOLIO_PROGRESS_HPP

#include <string>
#include <utility>

namespace folio {

class EventBus;

/**
 * @brief Receives (current, total, context) updates from a running operation.
 *
 * Purely observational: reporting never affects control flow and never
 * throws. Calls happen synchronously, in operation order, while the
 * engine lock is held, so implementations must return quickly.
 */
class IProgressReporter {
public:
    virtual ~IProgressReporter() = default;

    virtual void report(int current, int total, const std::string& context) noexcept = 0;
};

/**
 * @brief Reports to @p reporter when present; a null reporter is a no-op.
 */
inline void report_progress(IProgressReporter* reporter, const int current, const int total,
                            const std::string& context = {}) noexcept {
    if (reporter) {
        reporter->report(current, total, context);
    }
}

/**
 * @brief Publishes progress as ProgressEvent on an EventBus.
 */
class EventBusProgressReporter final : public IProgressReporter {
public:
    EventBusProgressReporter(EventBus& bus, std::string operation)
        : bus_(bus), operation_(std::move(operation)) {}

    void report(int current, int total, const std::string& context) noexcept override;

private:
    EventBus& bus_;
    std::string operation_;
};

} // namespace folio

#endif // FOLIO_PROGRESS_HPP
