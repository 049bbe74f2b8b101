//
// Created by Giuseppe Francione on 02/02/26.
//

/**
 * @file logger.hpp
 * @brief Process-wide logging entry point for libfolio and the CLI.
 */

#ifndef FOLIO_LOGGER_HPP
#define FOLIO_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Static logger shared by every module.
 *
 * Each call is delivered to all installed sinks, in installation order,
 * under one lock. A sink must not log from inside its own log().
 */
class Logger {
public:
    /// @brief Installs @p sink; Logger owns it from now on. Null is ignored.
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Uninstalls and destroys the sink at address @p sink, if installed.
    static void remove_sink(const ILogSink* sink);

    static void clear_sinks();

    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "folio");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Maps a --log-level value to a level.
     * Accepts "WARN" as well as "WARNING"; anything unknown maps to Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

/**
 * @brief Keeps a sink installed for the lifetime of this object.
 *
 * Used where a sink belongs to a shorter-lived owner, such as the bridge
 * sink of a Folio instance or a test fixture.
 */
class ScopedLogSink {
public:
    explicit ScopedLogSink(std::unique_ptr<ILogSink> sink) : sink_(sink.get()) {
        Logger::add_sink(std::move(sink));
    }

    ~ScopedLogSink() {
        if (sink_) Logger::remove_sink(sink_);
    }

    ScopedLogSink(const ScopedLogSink&) = delete;
    ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
    const ILogSink* sink_;
};

} // namespace folio

#endif // FOLIO_LOGGER_HPP
