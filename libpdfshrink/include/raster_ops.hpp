//
// Sample-level raster transforms.
//

/**
 * @file raster_ops.hpp
 * @brief Unpacking, palette expansion, depth reduction, color conversion and resampling.
 */

#ifndef PDFSHRINK_RASTER_OPS_HPP
#define PDFSHRINK_RASTER_OPS_HPP

#include "raster.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace pdfshrink {

/**
 * @brief Size in bytes of packed sample data, rows padded to whole bytes.
 * @return height * ceil(width * channels * bpc / 8)
 */
[[nodiscard]] size_t packed_size(int width, int height, int channels, int bits_per_component) noexcept;

/**
 * @brief Converts packed rows into one byte (or two, for 16 bit) per sample.
 *
 * Depths 1, 2 and 4 are expanded to 8 bits. With @p scale the values are
 * stretched to 0..255 (color samples); without it they are kept as is
 * (palette indices). 8 and 16 bit data is copied unchanged.
 *
 * @pre packed.size() == packed_size(width, height, channels, bits_per_component)
 */
[[nodiscard]] std::vector<unsigned char> unpack_samples(std::span<const unsigned char> packed,
                                                        int width, int height, int channels,
                                                        int bits_per_component, bool scale);

/**
 * @brief Replaces every index with its palette entry. Out of range indices clamp to hival.
 */
[[nodiscard]] std::vector<unsigned char> expand_palette(std::span<const unsigned char> indices,
                                                        const Palette& palette);

/**
 * @brief Checks a /Decode array against the default for its color space.
 *
 * The default is [0 1] per component for color samples and
 * [0 2^bpc-1] for palette indices. An empty array is the default.
 */
[[nodiscard]] bool is_identity_decode(std::span<const double> ranges, int components,
                                      bool indexed, int bits_per_component) noexcept;

/**
 * @brief Maps 8-bit samples through one [Dmin Dmax] pair per channel.
 * @pre ranges.size() == 2 * channels
 */
void apply_decode_ranges(std::vector<unsigned char>& samples, int channels, std::span<const double> ranges);

/**
 * @brief Maps palette indices through an Indexed /Decode pair.
 *
 * Results are rounded and clamped to 0..hival.
 * @pre range.size() == 2
 */
void remap_indices(std::vector<unsigned char>& indices, int bits_per_component, int hival,
                   std::span<const double> range);

/// Drops the low byte of 16-bit big-endian samples in place.
void reduce_to_8bit(DecodedRaster& raster);

/**
 * @brief Converts an 8-bit CMYK raster to RGB in place.
 *
 * Pending /Decode ranges are applied first; without them an Adobe
 * inversion is undone instead.
 */
void convert_cmyk_to_rgb(DecodedRaster& raster);

/**
 * @brief Largest size with the same aspect ratio that fits the bounds.
 *
 * Returns the input size unchanged when it already fits; never upscales.
 * Both results are at least 1.
 */
[[nodiscard]] std::pair<int, int> fit_within(int width, int height,
                                             std::optional<int> max_width,
                                             std::optional<int> max_height) noexcept;

/**
 * @brief Resamples an 8-bit raster with stb_image_resize.
 *
 * Gray and RGB use the sRGB-aware filter; CMYK is resampled linearly.
 *
 * @return false if the resampler failed; @p raster is left untouched then.
 */
[[nodiscard]] bool resize_raster(DecodedRaster& raster, int new_width, int new_height);

} // namespace pdfshrink

#endif // PDFSHRINK_RASTER_OPS_HPP
