//
// Created by Giuseppe Francione on 02/02/26.
//

#include "../../include/logger.hpp"
#include <algorithm>

namespace folio {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const ILogSink* sink) {
    std::unique_ptr<ILogSink> removed;
    {
        std::lock_guard lock(mtx_);
        const auto it = std::find_if(sinks_.begin(), sinks_.end(),
                                     [sink](const auto& s) { return s.get() == sink; });
        if (it == sinks_.end()) return;
        removed = std::move(*it);
        sinks_.erase(it);
    }
    // destroyed outside the lock
}

void Logger::clear_sinks() {
    std::vector<std::unique_ptr<ILogSink>> removed;
    {
        std::lock_guard lock(mtx_);
        removed.swap(sinks_);
    }
}

void Logger::log(const LogLevel level, const std::string_view msg, const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

} // namespace folio
