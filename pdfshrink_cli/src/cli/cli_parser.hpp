//
// Command line options of the pdfshrink tool.
//

#ifndef PDFSHRINK_CLI_PARSER_HPP
#define PDFSHRINK_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include "../../../libpdfshrink/include/compression_policy.hpp"
#include "../../../libpdfshrink/include/pdf_compressor.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool no_meta = false;
    bool zopfli = false;
    bool linearize = false;
    bool recursive = false;
    bool dry_run = false;
    bool analyze = false;
    bool silent = false;
    bool no_resize = false;

    std::optional<int> quality;
    std::optional<int> gray_quality;
    std::string tier;
    int max_width = pdfshrink::CompressionPolicy::kDefaultMaxDimension;
    int max_height = pdfshrink::CompressionPolicy::kDefaultMaxDimension;
    pdfshrink::CmykHandling cmyk = pdfshrink::CmykHandling::Preserve;
    std::string strategy_order = "direct,jpeg,generic";
    double min_savings = pdfshrink::CompressionPolicy::kDefaultMinSavingsPercent;
    int zopfli_iterations = 15;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Turns the parsed image options into a policy.
 *
 * A tier sets both qualities; explicit --quality and --gray-quality
 * override it.
 *
 * @throws std::invalid_argument if the resulting policy is invalid.
 */
pdfshrink::CompressionPolicy build_policy(const Settings& settings);

pdfshrink::CompressOptions build_options(const Settings& settings);

#endif // PDFSHRINK_CLI_PARSER_HPP
