//
// Encoding classification of image resources.
//

/**
 * @file format_sniffer.hpp
 * @brief Classifies an image by its declared filter chain.
 */

#ifndef PDFSHRINK_FORMAT_SNIFFER_HPP
#define PDFSHRINK_FORMAT_SNIFFER_HPP

#include "image_resource.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pdfshrink {

enum class ImageEncoding {
    RawFlateRaster, ///< Lossless filters (or none) over raw samples
    EmbeddedJpeg,   ///< A DCT filter is present in the chain
    Unsupported     ///< JBIG2, JPX, CCITT and anything unknown
};

[[nodiscard]] constexpr std::string_view to_string(const ImageEncoding e) noexcept {
    switch (e) {
        case ImageEncoding::RawFlateRaster: return "raw";
        case ImageEncoding::EmbeddedJpeg:   return "jpeg";
        case ImageEncoding::Unsupported:    return "unsupported";
    }
    return "unknown";
}

/**
 * @brief Pure classification of the declared filter chain.
 *
 * No stream bytes are inspected. Filters are listed in decode order, so
 * the first entry is the outermost (last applied when encoding).
 */
class FormatSniffer {
public:
    [[nodiscard]] static ImageEncoding classify(const std::vector<std::string>& filters,
                                                const ColorSpaceDecl& color_space) noexcept;

    [[nodiscard]] static ImageEncoding classify(const ImageResource& resource) noexcept {
        return classify(resource.filters, resource.color_space);
    }

    /// @return true for Flate, LZW, RunLength, ASCIIHex and ASCII85 (full or abbreviated).
    [[nodiscard]] static bool is_lossless_filter(std::string_view name) noexcept;

    /// @return true for /DCTDecode and /DCT.
    [[nodiscard]] static bool is_dct_filter(std::string_view name) noexcept;
};

} // namespace pdfshrink

#endif // PDFSHRINK_FORMAT_SNIFFER_HPP
