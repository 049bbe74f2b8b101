//
// Created by Giuseppe Francione on 02/02/26.
//

#ifndef FOLIO_LOG_SINK_HPP
#define FOLIO_LOG_SINK_HPP

#include <string_view>

namespace folio {

/**
 * @brief Message severity, ordered from least to most severe.
 */
enum class LogLevel {
    Debug,   ///< per-page and per-file details
    Info,    ///< one line per completed operation
    Warning, ///< skipped inputs, ignored page numbers, engine warnings
    Error    ///< the failure that is about to be thrown
};

/**
 * @brief Destination for log lines.
 *
 * Sinks are owned by Logger and may be called from any thread that runs an
 * operation, always under Logger's lock.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @param level Severity of the line.
     * @param message Text without a trailing newline.
     * @param tag Emitting module, e.g. "document_assembler".
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace folio

#endif // FOLIO_LOG_SINK_HPP
