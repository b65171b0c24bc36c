//
// Command line options of the pdfshrink tool.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <thread>
#include <algorithm>
#include <map>
#include <stdexcept>

using namespace pdfshrink;

namespace {
// helper for validating the decode strategy list
struct StrategyOrderValidator : CLI::Validator {
    StrategyOrderValidator() {
        name_ = "STRATEGIES";
        func_ = [](const std::string& str) {
            if (!parse_strategy_order(str).has_value()) {
                return std::string("Invalid strategy order: '") + str +
                       "'. Use a comma separated list of distinct names among: direct, jpeg, generic.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.3");

    // --- Image options ---
    app.add_option("-q,--quality", settings.quality,
                   "JPEG quality for color images (1-100, default 30).")
                   ->check(CLI::Range(1, 100));

    app.add_option("--gray-quality", settings.gray_quality,
                   "JPEG quality for grayscale images (1-100, default: same as --quality).")
                   ->check(CLI::Range(1, 100));

    app.add_option("--tier", settings.tier,
                   "Quality preset: high, balanced or compact.")
                   ->check(CLI::IsMember({"high", "balanced", "compact"}, CLI::ignore_case));

    app.add_option("--max-width", settings.max_width,
                   "Downscale images wider than this many pixels.")
                   ->default_val(settings.max_width)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-height", settings.max_height,
                   "Downscale images taller than this many pixels.")
                   ->default_val(settings.max_height)
                   ->check(CLI::PositiveNumber);

    app.add_flag("--no-resize", settings.no_resize,
                 "Never downscale images.");

    app.add_option("--cmyk", settings.cmyk, "CMYK images: 'preserve' (default) or 'rgb'.")
        ->default_val(CmykHandling::Preserve)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, CmykHandling>{
                {"preserve", CmykHandling::Preserve},
                {"rgb", CmykHandling::ConvertToRgb}
            }, CLI::ignore_case));

    app.add_option("--strategy-order", settings.strategy_order,
                   "Decode strategies to try, in order.")
                   ->default_val(settings.strategy_order)
                   ->check(StrategyOrderValidator());

    app.add_option("--min-savings", settings.min_savings,
                   "Replace an image only if it shrinks by at least this percentage.")
                   ->default_val(settings.min_savings)
                   ->check(CLI::Range(0.0, 100.0));

    // --- Document options ---
    app.add_flag("--no-meta", settings.no_meta,
                 "Remove the document information dictionary and XMP metadata.");

    app.add_flag("--zopfli", settings.zopfli,
                 "Recompress remaining Flate streams with Zopfli (slow).");

    app.add_option("--zopfli-iterations", settings.zopfli_iterations,
                   "Zopfli iterations per stream.")
                   ->default_val(settings.zopfli_iterations)
                   ->check(CLI::Range(1, 1000));

    app.add_flag("--linearize", settings.linearize,
                 "Write a linearized (web optimized) file.");

    // --- Run options ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("--dry-run", settings.dry_run,
                 "Compress in memory and report the results without writing files.");

    app.add_flag("--analyze", settings.analyze,
                 "Only analyze the inputs and print recommendations.");

    app.add_flag("-s,--silent", settings.silent,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("-o,--output", settings.output_path,
                   "Output file (single input) or directory (several inputs).\n"
                   "Default: <name>_compressed.pdf next to each input.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for image decoding and encoding.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more PDF files or directories")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.dry_run && !settings.output_path.empty()) {
            throw CLI::ValidationError("--dry-run and -o, --output cannot be used together.");
        }
        if (settings.analyze && !settings.output_path.empty()) {
            throw CLI::ValidationError("--analyze does not write files; drop -o, --output.");
        }
        if (settings.inputs.size() > 1 && !settings.output_path.empty() &&
            std::filesystem::is_regular_file(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory when several inputs are given.");
        }
    });
}

CompressionPolicy build_policy(const Settings& settings) {
    CompressionPolicy policy;
    if (!settings.tier.empty()) {
        const auto tier = parse_quality_tier(settings.tier);
        if (!tier) {
            throw std::invalid_argument("unknown tier: " + settings.tier);
        }
        policy = CompressionPolicy::from_tier(*tier);
    }
    if (settings.quality) {
        policy.quality = *settings.quality;
        // without a tier, gray follows the color quality
        if (settings.tier.empty()) {
            policy.grayscale_quality.reset();
        }
    }
    if (settings.gray_quality) {
        policy.grayscale_quality = settings.gray_quality;
    }

    if (settings.no_resize) {
        policy.max_width.reset();
        policy.max_height.reset();
    } else {
        policy.max_width = settings.max_width;
        policy.max_height = settings.max_height;
    }

    policy.cmyk_handling = settings.cmyk;
    const auto order = parse_strategy_order(settings.strategy_order);
    if (!order) {
        throw std::invalid_argument("invalid strategy order: " + settings.strategy_order);
    }
    policy.strategy_order = *order;
    policy.min_savings_percent = settings.min_savings;

    policy.validate();
    return policy;
}

CompressOptions build_options(const Settings& settings) {
    CompressOptions options;
    options.strip_metadata = settings.no_meta;
    options.zopfli_streams = settings.zopfli;
    options.zopfli_iterations = settings.zopfli_iterations;
    options.linearize = settings.linearize;
    options.dry_run = settings.dry_run;
    options.threads = settings.num_threads;
    return options;
}
