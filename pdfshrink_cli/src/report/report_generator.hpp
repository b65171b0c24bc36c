//
// Console and CSV reports of a pdfshrink run.
//

#ifndef PDFSHRINK_REPORT_GENERATOR_HPP
#define PDFSHRINK_REPORT_GENERATOR_HPP

#include <vector>
#include <string>
#include <filesystem>
#include "../../../libpdfshrink/include/pdf_analyzer.hpp"
#include "../../../libpdfshrink/include/run_report.hpp"

struct Result {
    std::filesystem::path path;   // input document
    std::filesystem::path output; // written file, empty on a dry run or failure
    uintmax_t size_before{};      // original size in bytes
    uintmax_t size_after{};       // output size in bytes
    bool success{};               // document was processed
    bool replaced{};              // output is smaller than the input
    double seconds{};             // processing time
    std::string summary;          // "N images compressed, M left unchanged (...)"
    std::vector<pdfshrink::ImageRecord> images;
    std::string error_msg;        // if !success, reason of failure
};

/// @return A report row for a completed pass.
Result make_result(const pdfshrink::RunReport& report);

void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds,
                          bool dry_run);

void export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

void print_analysis_report(const pdfshrink::AnalysisReport& report);

unsigned get_terminal_width();

#endif // PDFSHRINK_REPORT_GENERATOR_HPP
