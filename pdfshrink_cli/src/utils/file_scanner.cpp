//
// Expansion of command line inputs into PDF files.
//

#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include "../../../libpdfshrink/include/mime_detector.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace fs = std::filesystem;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name == ".ds_store" || name == "desktop.ini";
}

namespace {
bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();

    for (const auto& pattern : settings.exclude_patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, "Invalid exclude regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }

    if (!settings.include_patterns.empty()) {
        for (const auto& pattern : settings.include_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return false;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid include regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return true;
    }

    return false;
}

// outputs of a previous run sitting next to their inputs
bool is_previous_output(const fs::path& path) {
    return path.stem().string().ends_with("_compressed");
}
} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings) {
    std::vector<fs::path> candidates;

    for (const auto& in : inputs) {
        if (!fs::exists(in)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in)) {
            auto accept = [&](const fs::path& p) {
                if (fs::is_regular_file(p) && !is_junk(p) && !is_previous_output(p) && !is_filtered(p, settings))
                    candidates.push_back(p);
            };
            if (settings.recursive) {
                for (auto& e : fs::recursive_directory_iterator(in)) accept(e.path());
            } else {
                for (auto& e : fs::directory_iterator(in)) accept(e.path());
            }
        } else if (fs::is_regular_file(in) && !is_junk(in) && !is_filtered(in, settings)) {
            candidates.push_back(in);
        }
    }

    std::vector<fs::path> result;
    std::set<fs::path> seen;
    for (auto& p : candidates) {
        if (!seen.insert(fs::weakly_canonical(p)).second) {
            continue;
        }
        if (!pdfshrink::MimeDetector::is_pdf(p)) {
            Logger::log(LogLevel::Warning, "Not a PDF, skipping: " + p.string(), "scanner");
            continue;
        }
        result.push_back(std::move(p));
    }
    std::ranges::sort(result);

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
