//
// pdfshrink command line tool.
//

#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libpdfshrink/include/event_bus.hpp"
#include "../../libpdfshrink/include/events.hpp"
#include "../../libpdfshrink/include/logger.hpp"
#include "../../libpdfshrink/include/pdf_analyzer.hpp"
#include "../../libpdfshrink/include/pdf_compressor.hpp"
#include "../../libpdfshrink/include/pipeline_errors.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "utils/interrupt_watcher.hpp"

// simple progress bar printer
inline void print_progress_bar(const std::string& name, const size_t done, const size_t total,
                               const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }

    std::string label = name.size() > 18 ? name.substr(0, 15) + "..." : name;
    std::cerr << "\r" << std::left << std::setw(19) << label << "[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::right << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << " images)"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace pdfshrink;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

// handle ctrl+c or termination signals; only the flag is touched here
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

static fs::path resolve_output(const Settings& settings, const fs::path& input, const size_t num_inputs) {
    if (settings.output_path.empty()) {
        return PdfCompressor::default_output_path(input);
    }
    if (num_inputs == 1 && !fs::is_directory(settings.output_path)) {
        return settings.output_path;
    }
    fs::create_directories(settings.output_path);
    return settings.output_path / input.filename();
}

static int run_analysis(const std::vector<fs::path>& inputs) {
    int status = 0;
    for (const auto& input : inputs) {
        try {
            print_analysis_report(PdfAnalyzer::analyze(input));
        } catch (const DocumentError& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
            std::cerr << RED << "Cannot analyze " << input.string() << ": " << e.what() << RESET << std::endl;
            status = 1;
        }
    }
    return status;
}

int main(int argc, char* argv[]) {

    CLI::App app{"pdfshrink: shrink PDF files by recompressing their images."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set loggers; the gate drops what no sink would print
    Logger::clear_sinks();
    Logger::set_min_level(LogLevel::Error);
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
            Logger::set_min_level(LogLevel::Debug);
        }
    }
    if (!settings.silent && settings.log_level != "NONE") {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level);
        if (!Logger::enabled(console_sink->log_level)) {
            Logger::set_min_level(console_sink->log_level);
        }
        Logger::add_sink(std::move(console_sink));
    }

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        std::cerr << RED << "No PDF files to process." << RESET << std::endl;
        return 1;
    }

    if (settings.analyze) {
        return run_analysis(inputs);
    }

    CompressionPolicy policy;
    try {
        policy = build_policy(settings);
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid settings: " << e.what() << RESET << std::endl;
        return 2;
    }

    EventBus bus;
    std::vector<Result> results;
    const auto start_total = std::chrono::steady_clock::now();
    auto start_document = start_total;
    std::string current_name;

    bus.subscribe<DocumentScanCompleteEvent>([&](const DocumentScanCompleteEvent& e) {
        current_name = e.path.filename().string();
        start_document = std::chrono::steady_clock::now();
        if (!settings.silent) {
            print_progress_bar(current_name, 0, e.images + e.skipped, 0.0);
        }
    });

    bus.subscribe<ImageProcessedEvent>([&](const ImageProcessedEvent& e) {
        if (settings.silent) return;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_document).count();
        print_progress_bar(current_name, e.index, e.total, elapsed);
    });

    bus.subscribe<DocumentCompleteEvent>([&](const DocumentCompleteEvent& e) {
        if (settings.silent) return;
        const bool smaller = e.new_size < e.original_size;
        std::cerr
            << (smaller ? GREEN : YELLOW)
            << "\n[DONE] " << e.path.filename().string()
            << " (" << e.original_size << " -> " << e.new_size << " bytes)"
            << (settings.dry_run ? " [DRY-RUN]" : smaller ? " [OK]" : " [kept]")
            << RESET << std::endl;
    });

    bus.subscribe<DocumentErrorEvent>([&](const DocumentErrorEvent& e) {
        if (!settings.silent) {
            std::cerr << RED << "\n[FAIL] " << e.path.filename().string() << " " << e.error_message
                      << RESET << std::endl;
        }
    });

    PdfCompressor compressor(policy, build_options(settings), bus);
    std::jthread watcher = watch_interrupts(interrupted, [&compressor] {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Waiting for running images to finish..."
                  << RESET << std::endl;
        compressor.request_stop();
    });

    bool any_failed = false;
    for (const auto& input : inputs) {
        if (interrupted.load()) break;
        Result r;
        try {
            const fs::path output = settings.dry_run ? fs::path{} : resolve_output(settings, input, inputs.size());
            r = make_result(compressor.run(input, output));
        } catch (const std::exception& e) {
            // DocumentError was already published; anything else comes from resolving the output
            Logger::log(LogLevel::Error, input.filename().string() + " " + e.what(), "main");
            r.path = input;
            std::error_code ec;
            r.size_before = fs::file_size(input, ec);
            r.success = false;
            r.error_msg = e.what();
            any_failed = true;
        }
        results.push_back(std::move(r));
    }
    watcher.request_stop();
    watcher.join();

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.silent) {
        print_console_report(results, settings.num_threads, total_seconds, settings.dry_run);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        export_csv_report(results, settings.report_path, total_seconds);
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return any_failed ? 1 : 0;
}
