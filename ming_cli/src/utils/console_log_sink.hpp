#ifndef MING_CONSOLE_LOG_SINK_HPP
#define MING_CONSOLE_LOG_SINK_HPP

#include "../../../libming/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public ming::ILogSink {
public:
    ming::LogLevel log_level = ming::LogLevel::Error;

    void log(const ming::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) {
            return;
        }
        std::lock_guard lock(mtx_);
        switch (level) {
            case ming::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case ming::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case ming::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case ming::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // MING_CONSOLE_LOG_SINK_HPP
