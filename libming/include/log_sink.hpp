/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by the Logger.
 */

#ifndef MING_LOG_SINK_HPP
#define MING_LOG_SINK_HPP

#include <string_view>

namespace ming {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information
    Info,    ///< Normal progress (inputs, groups, written PDFs)
    Warning, ///< Recoverable problems (skipped image, failed cleanup)
    Error    ///< Failures that lose output (unreadable archive, write error)
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, a GUI
 * observer). The Logger forwards every message to all installed sinks;
 * filtering by level is the sink's business.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "zip_archive").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace ming

#endif // MING_LOG_SINK_HPP
