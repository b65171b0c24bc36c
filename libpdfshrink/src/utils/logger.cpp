//
// Static logging facade.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 5> kLevelNames = {{
    {"DEBUG", LogLevel::Debug},
    {"INFO", LogLevel::Info},
    {"WARN", LogLevel::Warning},
    {"WARNING", LogLevel::Warning},
    {"ERROR", LogLevel::Error},
}};

bool iequals(const std::string_view a, const std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
               return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::atomic<LogLevel> Logger::min_level_{LogLevel::Debug};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
    set_min_level(LogLevel::Debug);
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (!enabled(level)) return;
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

const char* Logger::level_to_string(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "";
}

std::optional<LogLevel> Logger::parse_level(const std::string_view level) noexcept {
    const auto it = std::ranges::find_if(kLevelNames, [level](const auto& entry) {
        return iequals(entry.first, level);
    });
    if (it == kLevelNames.end()) return std::nullopt;
    return it->second;
}

LogLevel Logger::string_to_level(const std::string_view level) noexcept {
    return parse_level(level).value_or(LogLevel::Error);
}
