//
// Expansion of command line inputs into PDF files.
//

#ifndef PDFSHRINK_FILE_SCANNER_HPP
#define PDFSHRINK_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

struct Settings;

/**
 * @brief Expands files and directories into the PDF documents to process.
 *
 * Directories are listed (recursively with -r), junk files and paths
 * rejected by the include/exclude patterns are dropped, and everything
 * libmagic does not identify as a PDF is skipped with a warning.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

#endif // PDFSHRINK_FILE_SCANNER_HPP
