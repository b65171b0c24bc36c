//
// Decoded rasters and encoded replacements.
//

#ifndef PDFSHRINK_RASTER_HPP
#define PDFSHRINK_RASTER_HPP

#include "color_model.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pdfshrink {

/**
 * @brief An image decoded to interleaved samples.
 *
 * Sub-byte depths are unpacked to 8 bits; 16-bit samples are stored
 * big-endian, two bytes per channel.
 */
struct DecodedRaster {
    std::vector<unsigned char> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;
    int bit_depth = 8;
    ColorModel model = GrayModel{};        ///< Layout of @ref pixels (never Indexed once decoded)
    ColorModel source_model = GrayModel{}; ///< Model as declared by the document
    bool adobe_cmyk = false;               ///< CMYK samples stored inverted, as in Adobe-marked JPEGs
    std::vector<double> decode;            ///< /Decode ranges not yet applied to @ref pixels, empty for identity

    [[nodiscard]] size_t bytes_per_channel() const noexcept { return bit_depth > 8 ? 2 : 1; }

    [[nodiscard]] size_t expected_size() const noexcept {
        return static_cast<size_t>(width) * static_cast<size_t>(height) *
               static_cast<size_t>(channels) * bytes_per_channel();
    }

    /// @return true if dimensions are positive and the buffer matches them.
    [[nodiscard]] bool valid() const noexcept {
        return width > 0 && height > 0 && channels > 0 && pixels.size() == expected_size();
    }
};

/**
 * @brief Color space written into a rewritten image dictionary.
 */
enum class OutputColorSpace { DeviceGray, DeviceRGB, DeviceCMYK };

[[nodiscard]] constexpr std::string_view pdf_name(const OutputColorSpace cs) noexcept {
    switch (cs) {
        case OutputColorSpace::DeviceGray: return "/DeviceGray";
        case OutputColorSpace::DeviceRGB:  return "/DeviceRGB";
        case OutputColorSpace::DeviceCMYK: return "/DeviceCMYK";
    }
    return "";
}

[[nodiscard]] constexpr int components(const OutputColorSpace cs) noexcept {
    switch (cs) {
        case OutputColorSpace::DeviceGray: return 1;
        case OutputColorSpace::DeviceRGB:  return 3;
        case OutputColorSpace::DeviceCMYK: return 4;
    }
    return 0;
}

/**
 * @brief Output of the Recompressor for one image.
 */
struct EncodedReplacement {
    std::vector<unsigned char> data;
    OutputColorSpace color_space = OutputColorSpace::DeviceRGB;
    std::string filter = "/DCTDecode";
    int width = 0;
    int height = 0;
    int bits_per_component = 8;
    int quality = 0;   ///< Effective JPEG quality used
};

} // namespace pdfshrink

#endif // PDFSHRINK_RASTER_HPP
