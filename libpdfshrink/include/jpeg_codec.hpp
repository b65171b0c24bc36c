//
// In-memory libjpeg encode/decode.
//

/**
 * @file jpeg_codec.hpp
 * @brief Thin libjpeg wrappers working on memory buffers.
 */

#ifndef PDFSHRINK_JPEG_CODEC_HPP
#define PDFSHRINK_JPEG_CODEC_HPP

#include <optional>
#include <span>
#include <vector>

namespace pdfshrink {

/**
 * @brief Samples of a decoded JPEG stream, as stored (no color conversion).
 */
struct JpegImage {
    std::vector<unsigned char> pixels;
    int width = 0;
    int height = 0;
    int components = 0; ///< 1, 3 or 4
    bool cmyk = false;  ///< Stream is CMYK or YCCK (4 components)
    bool adobe = false; ///< An Adobe APP14 marker was present
};

enum class JpegColor { Gray, Rgb, Cmyk };

/**
 * @brief Decodes a JPEG stream.
 *
 * Gray, YCbCr and RGB streams are returned as 1 or 3 components. CMYK and
 * YCCK streams are returned as 4 CMYK components exactly as libjpeg
 * delivers them.
 *
 * @return std::nullopt if libjpeg rejects the data.
 */
[[nodiscard]] std::optional<JpegImage> decode_jpeg(std::span<const unsigned char> data);

/**
 * @brief Encodes interleaved 8-bit samples as a baseline JPEG with optimized Huffman tables.
 *
 * @param pixels width * height * components bytes.
 * @param quality 1..100.
 * @param adobe_marker Write an Adobe APP14 marker (CMYK only), declaring the samples inverted.
 * @throws EncodeError on any libjpeg failure or inconsistent input.
 */
[[nodiscard]] std::vector<unsigned char> encode_jpeg(std::span<const unsigned char> pixels,
                                                     int width, int height,
                                                     JpegColor color, int quality,
                                                     bool adobe_marker = false);

} // namespace pdfshrink

#endif // PDFSHRINK_JPEG_CODEC_HPP
