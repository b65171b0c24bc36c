//
// Closed set of color models handled by the pipeline.
//

/**
 * @file color_model.hpp
 * @brief ColorModel variant and its resolution from declared metadata.
 *
 * The model is resolved once, from the declaration, and every later stage
 * matches on it exhaustively. A four-channel raster is CMYK because its
 * model says so, never because it has four channels.
 */

#ifndef PDFSHRINK_COLOR_MODEL_HPP
#define PDFSHRINK_COLOR_MODEL_HPP

#include "image_resource.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace pdfshrink {

struct GrayModel {};
struct RgbModel {};
struct CmykModel {};

/**
 * @brief Palette already converted to the output space.
 *
 * CMYK base palettes are converted to RGB entries, and palettes whose
 * entries are all neutral are stored as gray.
 */
struct Palette {
    int channels = 3;                  ///< 1 (gray entries) or 3 (RGB entries)
    int hival = 0;                     ///< Highest valid index
    std::vector<unsigned char> entries;///< (hival + 1) * channels bytes
};

struct IndexedModel {
    Palette palette;
};

using ColorModel = std::variant<GrayModel, RgbModel, CmykModel, IndexedModel>;

/// Visitor helper for exhaustive std::visit over ColorModel.
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// @return Values per pixel in stored sample data (1 for Indexed).
[[nodiscard]] int sample_channels(const ColorModel& model) noexcept;

/// @return Channels after palette expansion.
[[nodiscard]] int output_channels(const ColorModel& model) noexcept;

/// @return "Gray", "RGB", "CMYK" or "Indexed".
[[nodiscard]] std::string_view model_name(const ColorModel& model) noexcept;

/**
 * @brief Resolves the declared color space of an image.
 *
 * @param decl Parsed /ColorSpace entry.
 * @param bits_per_component Declared bit depth, if any.
 * @return The model, or std::nullopt when the space is unsupported or
 * absent without a 1-bit depth to infer grayscale from.
 */
[[nodiscard]] std::optional<ColorModel> resolve_color_model(const ColorSpaceDecl& decl,
                                                            std::optional<int> bits_per_component);

/**
 * @brief Builds the palette of an Indexed declaration.
 * @return std::nullopt if the base space is unsupported or the lookup
 * table is too short for hival.
 */
[[nodiscard]] std::optional<Palette> build_palette(const ColorSpaceDecl& decl);

/**
 * @brief Naive CMYK to RGB conversion of one sample set.
 */
inline void cmyk_to_rgb_pixel(const unsigned char* cmyk, unsigned char* rgb) noexcept {
    const unsigned k = 255u - cmyk[3];
    rgb[0] = static_cast<unsigned char>((255u - cmyk[0]) * k / 255u);
    rgb[1] = static_cast<unsigned char>((255u - cmyk[1]) * k / 255u);
    rgb[2] = static_cast<unsigned char>((255u - cmyk[2]) * k / 255u);
}

} // namespace pdfshrink

#endif // PDFSHRINK_COLOR_MODEL_HPP
