//
// Log sink appending to a file.
//

#ifndef PDFSHRINK_FILE_LOG_SINK_HPP
#define PDFSHRINK_FILE_LOG_SINK_HPP

#include "../../../libpdfshrink/include/log_sink.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include <fstream>
#include <mutex>
#include <string>

class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::string& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // PDFSHRINK_FILE_LOG_SINK_HPP
