//
// Created by Giuseppe Francione on 03/02/26.
//

#include "../../include/progress.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

namespace folio {

void EventBusProgressReporter::report(const int current, const int total,
                                      const std::string& context) noexcept {
    try {
        bus_.publish(ProgressEvent{operation_, current, total, context});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Progress handler failed: ") + e.what(), "progress");
    }
}

} // namespace folio
