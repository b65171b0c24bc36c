//
// Log sink interface shared by the library and the CLI.
//

#ifndef PDFSHRINK_LOG_SINK_HPP
#define PDFSHRINK_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format the output.
 */
enum class LogLevel {
    Debug,   ///< Per-image diagnostics (strategy attempts, resize decisions)
    Info,    ///< Normal progress of a document pass
    Warning, ///< An image or stream was left unchanged
    Error    ///< A document could not be processed
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where messages go (console, file, ...).
 * Logger forwards every message to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "decoder").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PDFSHRINK_LOG_SINK_HPP
