//
// Read-only diagnosis of a document's compression potential.
//

#ifndef PDFSHRINK_PDF_ANALYZER_HPP
#define PDFSHRINK_PDF_ANALYZER_HPP

#include "format_sniffer.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pdfshrink {

struct AnalyzedImage {
    std::string label;
    int page = 0;
    int width = 0;
    int height = 0;
    std::string filters;
    std::string color_space;
    ImageEncoding encoding = ImageEncoding::Unsupported;
    uintmax_t stored_bytes = 0;
};

struct AnalysisReport {
    std::filesystem::path path;
    uintmax_t file_size = 0;
    size_t pages = 0;
    size_t objects = 0;
    size_t streams = 0;
    size_t filtered_streams = 0;   ///< Streams with any /Filter
    size_t fonts = 0;
    size_t info_entries = 0;       ///< Keys in the document information dictionary
    bool has_xmp = false;
    size_t text_pages = 0;         ///< Pages whose content shows text operators
    std::vector<AnalyzedImage> images;
    size_t skipped_images = 0;     ///< Malformed image entries

    [[nodiscard]] size_t jpeg_images() const noexcept;
    [[nodiscard]] uintmax_t image_bytes() const noexcept;

    /// @return true when more than 70% of pages carry text.
    [[nodiscard]] bool text_heavy() const noexcept { return pages > 0 && text_pages * 10 > pages * 7; }

    /// @return Human-readable advice, most relevant first.
    [[nodiscard]] std::vector<std::string> recommendations() const;
};

class PdfAnalyzer {
public:
    /**
     * @brief Inspects a document without modifying it.
     * @throws DocumentError if the file cannot be opened or parsed.
     */
    [[nodiscard]] static AnalysisReport analyze(const std::filesystem::path& path);
};

} // namespace pdfshrink

#endif // PDFSHRINK_PDF_ANALYZER_HPP
