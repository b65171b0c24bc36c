//
// Static logging facade.
//

/**
 * @file logger.hpp
 * @brief Process-wide logger with a severity gate and pluggable sinks.
 *
 * Every component of the library logs through Logger, tagging messages
 * with its own name. The decode/encode workers log concurrently; sink
 * dispatch is serialized on one mutex, the severity gate is lock-free.
 */

#ifndef PDFSHRINK_LOGGER_HPP
#define PDFSHRINK_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

/**
 * @brief Static logging facade for pdfshrink.
 *
 * Messages below min_level() are dropped before any sink sees them.
 * Per-image diagnostics are built only when enabled(LogLevel::Debug)
 * holds, so a quiet run does not pay for formatting them.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of it.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Removes all sinks and resets the gate to LogLevel::Debug.
    static void clear_sinks();

    /**
     * @brief Lowest severity forwarded to sinks.
     *
     * Sinks may filter further; the gate only saves work upstream.
     */
    static void set_min_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] static LogLevel min_level() noexcept { return min_level_.load(std::memory_order_relaxed); }

    /// @return true if a message at @p level would reach the sinks.
    [[nodiscard]] static bool enabled(const LogLevel level) noexcept {
        return static_cast<int>(level) >= static_cast<int>(min_level());
    }

    /**
     * @brief Log a message to all registered sinks.
     * @param tag Component name (default: "pdfshrink").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pdfshrink");

    /// @return "DEBUG", "INFO", "WARN" or "ERROR".
    static const char* level_to_string(LogLevel level) noexcept;

    /**
     * @brief Parses a level name, case-insensitive.
     *
     * Accepts the names level_to_string produces plus "WARNING".
     * Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(std::string_view level) noexcept;

    /// @return The level, or std::nullopt for an unknown name.
    static std::optional<LogLevel> parse_level(std::string_view level) noexcept;

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
    static std::atomic<LogLevel> min_level_;
};

#endif // PDFSHRINK_LOGGER_HPP
