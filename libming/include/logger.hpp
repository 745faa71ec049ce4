/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * All library components log through Logger::log with a component tag.
 * Nothing is printed unless the embedding application installs sinks.
 */

#ifndef MING_LOGGER_HPP
#define MING_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ming {

/**
 * @brief Static logging facade for ming.
 *
 * Delegates log messages to every registered ILogSink.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove (and destroy) one sink previously passed to add_sink.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "ming").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "ming");

    /**
     * @brief Converts a LogLevel to its display string ("DEBUG", "INFO", ...).
     */
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
     * @brief Parses a level name as accepted by --log-level.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace ming

#endif // MING_LOGGER_HPP
