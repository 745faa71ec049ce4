#include "../../include/logger.hpp"
#include <vector>

namespace ming {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::remove_sink(const ILogSink* sink) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [sink](const std::unique_ptr<ILogSink>& s) { return s.get() == sink; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

} // namespace ming
