//
// Created by Giuseppe Francione on 17/02/26.
//

#ifndef FOLIO_CONSOLE_LOG_SINK_HPP
#define FOLIO_CONSOLE_LOG_SINK_HPP

#include "../../../libfolio/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes log lines at or above log_level to stderr.
 * Output goes to stderr so that text and json results on stdout stay clean.
 */
class ConsoleLogSink final : public folio::ILogSink {
public:
    folio::LogLevel log_level = folio::LogLevel::Error;
    bool use_colors = true;

    void log(const folio::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case folio::LogLevel::Debug:
                write(GRAY, "[DEBUG]", message, tag);
                break;
            case folio::LogLevel::Info:
                write("", "[INFO ]", message, tag);
                break;
            case folio::LogLevel::Warning:
                write(YELLOW, "[WARN ]", message, tag);
                break;
            case folio::LogLevel::Error:
                write(RED, "[ERROR]", message, tag);
                break;
        }
    }

private:
    void write(const char* color, const char* label,
               const std::string_view message, const std::string_view tag) const {
        const bool colored = use_colors && *color != '\0';
        if (colored) std::cerr << color;
        std::cerr << label << "[" << tag << "] " << message;
        if (colored) std::cerr << RESET;
        std::cerr << std::endl;
    }

    std::mutex mtx_;
};

#endif // FOLIO_CONSOLE_LOG_SINK_HPP
