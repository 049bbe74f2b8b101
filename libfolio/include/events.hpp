//
// Created by Giuseppe Francione on 03/02/26.
//

#ifndef FOLIO_EVENTS_HPP
#define FOLIO_EVENTS_HPP

#include <chrono>
#include <string>

namespace folio {

/**
 * @brief Events published while an operation runs.
 *
 * Plain data carriers used with EventBus. Every operation publishes one
 * start event, any number of progress events and exactly one complete or
 * error event.
 */

/**
 * @brief Emitted when an operation begins.
 */
struct OperationStartEvent {
    std::string operation; ///< Operation name (e.g. "split")
    std::string input;     ///< Primary input, if any
};

/**
 * @brief Emitted as an operation advances.
 */
struct ProgressEvent {
    std::string operation; ///< Operation name
    int current = 0;       ///< Units done so far
    int total = 0;         ///< Units expected
    std::string context;   ///< Produced file, consumed input or empty
};

/**
 * @brief Emitted when an operation completes successfully.
 */
struct OperationCompleteEvent {
    std::string operation;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an operation fails.
 */
struct OperationErrorEvent {
    std::string operation;
    std::string error_message;
};

} // namespace folio

#endif // FOLIO_EVENTS_HPP
