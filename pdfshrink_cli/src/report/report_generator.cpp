//
// Console and CSV reports of a pdfshrink run.
//

#include "report_generator.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include <iostream>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace pdfshrink;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

static double delta_percent(const Result& r) {
    return r.success && r.size_before && r.size_after < r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

static std::string outcome_of(const Result& r, const bool dry_run) {
    if (!r.success) return "FAIL";
    if (!r.replaced) return "OK (kept)";
    return dry_run ? "OK (dry-run)" : "OK (smaller)";
}

static std::string colorize(const std::string& outcome, const bool use_colors) {
    if (!use_colors) return outcome;
    if (outcome == "FAIL") return "\033[1;31m" + outcome + "\033[0m";
    if (outcome == "OK (kept)") return "\033[1;33m" + outcome + "\033[0m";
    return "\033[1;32m" + outcome + "\033[0m";
}

Result make_result(const RunReport& report) {
    Result r;
    r.path = report.input;
    r.output = report.output;
    r.size_before = report.original_size;
    r.size_after = report.new_size;
    r.success = true;
    r.replaced = !report.kept_original && report.new_size < report.original_size;
    r.seconds = report.seconds;
    r.summary = report.summary();
    r.images = report.images;
    return r;
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds,
                          const bool dry_run) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_delta = 10;
    size_t max_time = 10;
    size_t max_result = 14;
    size_t max_error = 5;
    for (const auto& r : results) {
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.size_after / 1024).size() + 2);
        max_time   = std::max(max_time,   fixed2(r.seconds).size() + 2);
        max_result = std::max(max_result, outcome_of(r, dry_run).size() + 2);
        max_error  = std::max(max_error,  r.error_msg.size());
    }

    const unsigned fixed_cols_width = max_before + max_after + max_delta + max_time + max_result + max_error;
    const unsigned file_col_width = term_width > fixed_cols_width + 15
                                ? term_width - fixed_cols_width
                                : 15;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 4) + "... ";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_before) << "Before(KB)"
              << std::setw(max_after)  << "After(KB)"
              << std::setw(max_delta)  << "Delta(%)"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << "Error"
              << "\n";

    uintmax_t total_original = 0;
    uintmax_t total_saved = 0;
    size_t total_images = 0;
    size_t total_compressed = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string delta = r.success ? fixed2(delta_percent(r)) + "%" : "-";
        const std::string outcome = outcome_of(r, dry_run);
        // setw counts the escape sequences, pad by hand
        const std::string shown = colorize(outcome, use_colors);
        const std::string padding(max_result > outcome.size() ? max_result - outcome.size() : 1, ' ');

        total_original += r.size_before;
        if (r.replaced) total_saved += r.size_before - r.size_after;

        std::cerr << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(max_before) << (r.size_before / 1024)
                  << std::setw(max_after)  << (r.size_after / 1024)
                  << std::setw(max_delta)  << delta
                  << std::setw(max_time)   << fixed2(r.seconds)
                  << shown << padding
                  << r.error_msg
                  << "\n";

        if (!r.success) continue;
        std::cerr << "    Images: " << r.summary << "\n";
        for (const auto& img : r.images) {
            ++total_images;
            if (img.status == ImageStatus::Compressed) ++total_compressed;
            std::cerr << "      " << std::left << std::setw(28) << truncate(img.label, 28)
                      << std::setw(10) << img.encoding
                      << std::setw(10) << img.source_color
                      << std::setw(22) << (std::to_string(img.width_before) + "x" + std::to_string(img.height_before) +
                                           " -> " + std::to_string(img.width_after) + "x" +
                                           std::to_string(img.height_after))
                      << std::setw(26) << (std::to_string(img.size_before) + " -> " + std::to_string(img.size_after) + " B")
                      << to_string(img.status);
            if (!img.reason.empty()) std::cerr << ": " << img.reason;
            std::cerr << "\n";
        }
    }

    std::cerr << "\nImages compressed: " << total_compressed << " of " << total_images << "\n";
    std::cerr << "Total saved space: " << (total_saved / 1024) << " KB"
              << (dry_run ? " (dry-run, nothing written)" : "") << "\n";
    if (total_original > 0) {
        const double total_pct = 100.0 * (static_cast<double>(total_saved) / static_cast<double>(total_original));
        std::cerr << "Total reduction: " << fixed2(total_pct) << "%\n";
    }
    std::cerr << "Total time: " << fixed2(total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return;
    }

    out << "File,Before(KB),After(KB),Delta(%),Time(s),Result,Images,Error\n";
    for (const auto& r : results) {
        out << csv_escape(r.path.filename().string()) << ","
            << (r.size_before / 1024) << ","
            << (r.size_after / 1024) << ","
            << fixed2(delta_percent(r)) << ","
            << fixed2(r.seconds) << ","
            << csv_escape(outcome_of(r, false)) << ","
            << csv_escape(r.summary) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nFile,Image,Page,Encoding,Filters,Color in,Color out,Strategy,Quality,"
           "Width before,Height before,Width after,Height after,Before(B),After(B),Delta(%),Time(s),Result,Reason\n";
    for (const auto& r : results) {
        for (const auto& img : r.images) {
            out << csv_escape(r.path.filename().string()) << ","
                << csv_escape(img.label) << ","
                << img.page << ","
                << csv_escape(img.encoding) << ","
                << csv_escape(img.filters) << ","
                << csv_escape(img.source_color) << ","
                << csv_escape(img.output_color) << ","
                << csv_escape(img.strategy) << ","
                << img.quality << ","
                << img.width_before << "," << img.height_before << ","
                << img.width_after << "," << img.height_after << ","
                << img.size_before << "," << img.size_after << ","
                << fixed2(img.reduction_percent()) << ","
                << fixed2(img.seconds) << ","
                << csv_escape(std::string(to_string(img.status))) << ","
                << csv_escape(img.reason) << "\n";
        }
    }

    out << "\n\nTotal amount of time\n";
    out << fixed2(total_seconds) << " seconds\n";
}

void print_analysis_report(const AnalysisReport& report) {
    const auto pct = [](const size_t part, const size_t whole) {
        return whole ? fixed2(100.0 * static_cast<double>(part) / static_cast<double>(whole)) + "%" : std::string("-");
    };

    std::cout << "\n=== " << report.path.filename().string() << " ===\n"
              << "File size:          " << fixed2(static_cast<double>(report.file_size) / (1024.0 * 1024.0)) << " MB\n"
              << "Pages:              " << report.pages << "\n"
              << "Objects:            " << report.objects << "\n"
              << "Streams:            " << report.streams << " (" << pct(report.filtered_streams, report.streams)
              << " filtered)\n"
              << "Fonts:              " << report.fonts << "\n"
              << "Info entries:       " << report.info_entries << "\n"
              << "XMP metadata:       " << (report.has_xmp ? "yes" : "no") << "\n"
              << "Text pages:         " << report.text_pages << (report.text_heavy() ? " (text heavy)" : "") << "\n"
              << "Images:             " << report.images.size() << " (" << report.jpeg_images() << " JPEG, "
              << pct(report.jpeg_images(), report.images.size()) << ")\n"
              << "Image bytes:        " << (report.image_bytes() / 1024) << " KB\n";
    if (report.skipped_images > 0) {
        std::cout << "Malformed images:   " << report.skipped_images << "\n";
    }

    if (!report.images.empty()) {
        std::cout << "\n" << std::left
                  << std::setw(28) << "Image"
                  << std::setw(14) << "Size(px)"
                  << std::setw(14) << "Color"
                  << std::setw(26) << "Filters"
                  << std::setw(13) << "Class"
                  << "Stored(KB)\n";
        for (const auto& img : report.images) {
            std::cout << std::left
                      << std::setw(28) << img.label
                      << std::setw(14) << (std::to_string(img.width) + "x" + std::to_string(img.height))
                      << std::setw(14) << img.color_space
                      << std::setw(26) << img.filters
                      << std::setw(13) << to_string(img.encoding)
                      << (img.stored_bytes / 1024) << "\n";
        }
    }

    std::cout << "\nRecommendations:\n";
    for (const auto& line : report.recommendations()) {
        std::cout << "  - " << line << "\n";
    }
}
