//
// Results of one document pass.
//

/**
 * @file run_report.hpp
 * @brief Per-image records and per-document aggregate of a compression run.
 */

#ifndef PDFSHRINK_RUN_REPORT_HPP
#define PDFSHRINK_RUN_REPORT_HPP

#include "pipeline_errors.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pdfshrink {

/**
 * @brief Outcome of one image.
 */
struct ImageRecord {
    std::string label;           ///< e.g. "p3 /Im1 (12 0 R)"
    int page = 0;
    std::string encoding;        ///< Sniffer classification
    std::string filters;         ///< Declared filter chain
    int width_before = 0;
    int height_before = 0;
    int width_after = 0;         ///< Equal to width_before unless compressed
    int height_after = 0;
    std::string source_color;    ///< Declared color model, e.g. "Indexed"
    std::string output_color;    ///< Written color space, empty if unchanged
    std::string strategy;        ///< Decode strategy that succeeded, if any
    int quality = 0;             ///< JPEG quality used, 0 if not encoded
    uintmax_t size_before = 0;   ///< Stored stream bytes
    uintmax_t size_after = 0;    ///< Stored stream bytes after the pass
    ImageStatus status = ImageStatus::Unsupported;
    std::string reason;          ///< Why the image was left unchanged
    double seconds = 0.0;        ///< Decode and encode time

    [[nodiscard]] double reduction_percent() const noexcept {
        if (size_before == 0 || size_after >= size_before) return 0.0;
        return 100.0 * (1.0 - static_cast<double>(size_after) / static_cast<double>(size_before));
    }
};

/**
 * @brief Aggregate result of one document.
 */
struct RunReport {
    std::filesystem::path input;
    std::filesystem::path output;   ///< Empty on a dry run
    uintmax_t original_size = 0;    ///< Input file bytes
    uintmax_t new_size = 0;         ///< Serialized output bytes
    std::vector<ImageRecord> images;
    bool metadata_stripped = false;
    size_t streams_recompressed = 0;///< Non-image streams rewritten with Zopfli
    bool kept_original = false;     ///< Output did not shrink, so the input bytes were kept
    double seconds = 0.0;

    /**
     * @brief Marks the pass as discarded: the output is the input, byte for byte.
     *
     * Compressed records become NotSmaller with their original geometry, so
     * the counts match what was actually written.
     */
    void keep_original() {
        kept_original = true;
        new_size = original_size;
        for (auto& r : images) {
            if (r.status != ImageStatus::Compressed) continue;
            r.status = ImageStatus::NotSmaller;
            r.reason = "document not smaller, original kept";
            r.width_after = r.width_before;
            r.height_after = r.height_before;
            r.size_after = r.size_before;
            r.output_color.clear();
            r.quality = 0;
        }
    }

    [[nodiscard]] size_t count(const ImageStatus status) const noexcept {
        return static_cast<size_t>(std::ranges::count_if(images, [status](const ImageRecord& r) {
            return r.status == status;
        }));
    }

    [[nodiscard]] size_t compressed_count() const noexcept { return count(ImageStatus::Compressed); }

    [[nodiscard]] size_t unchanged_count() const noexcept { return images.size() - compressed_count(); }

    [[nodiscard]] double reduction_percent() const noexcept {
        if (original_size == 0 || new_size >= original_size) return 0.0;
        return 100.0 * (1.0 - static_cast<double>(new_size) / static_cast<double>(original_size));
    }

    /// @return e.g. "3 images compressed, 2 left unchanged (1 unsupported, 1 not smaller)".
    [[nodiscard]] std::string summary() const {
        std::string out = std::to_string(compressed_count()) + " images compressed, " +
                          std::to_string(unchanged_count()) + " left unchanged";
        std::string details;
        for (const auto status : {ImageStatus::NotSmaller, ImageStatus::LocatorSkip, ImageStatus::Unsupported,
                                  ImageStatus::DecodeFailed, ImageStatus::EncodeFailed, ImageStatus::Cancelled}) {
            if (const size_t n = count(status); n > 0) {
                if (!details.empty()) details += ", ";
                details += std::to_string(n) + " " + std::string(to_string(status));
            }
        }
        if (!details.empty()) {
            out += " (" + details + ")";
        }
        if (kept_original) {
            out += ", original kept";
        }
        return out;
    }
};

} // namespace pdfshrink

#endif // PDFSHRINK_RUN_REPORT_HPP
