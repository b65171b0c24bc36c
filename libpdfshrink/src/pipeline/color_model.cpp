//
// Color model resolution.
//

#include "../../include/color_model.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace {

// true if every RGB entry has equal components
bool palette_is_neutral(const std::vector<unsigned char>& rgb_entries) {
    for (size_t i = 0; i + 2 < rgb_entries.size(); i += 3) {
        if (rgb_entries[i] != rgb_entries[i + 1] || rgb_entries[i] != rgb_entries[i + 2]) {
            return false;
        }
    }
    return true;
}

} // namespace

namespace pdfshrink {

int sample_channels(const ColorModel& model) noexcept {
    return std::visit(overloaded{
        [](const GrayModel&) { return 1; },
        [](const RgbModel&) { return 3; },
        [](const CmykModel&) { return 4; },
        [](const IndexedModel&) { return 1; },
    }, model);
}

int output_channels(const ColorModel& model) noexcept {
    return std::visit(overloaded{
        [](const GrayModel&) { return 1; },
        [](const RgbModel&) { return 3; },
        [](const CmykModel&) { return 4; },
        [](const IndexedModel& m) { return m.palette.channels; },
    }, model);
}

std::string_view model_name(const ColorModel& model) noexcept {
    return std::visit(overloaded{
        [](const GrayModel&) -> std::string_view { return "Gray"; },
        [](const RgbModel&) -> std::string_view { return "RGB"; },
        [](const CmykModel&) -> std::string_view { return "CMYK"; },
        [](const IndexedModel&) -> std::string_view { return "Indexed"; },
    }, model);
}

std::optional<Palette> build_palette(const ColorSpaceDecl& decl) {
    if (decl.family != ColorFamily::Indexed || decl.hival < 0 || decl.hival > 255) {
        return std::nullopt;
    }

    int base_channels = 0;
    switch (decl.base_family) {
        case ColorFamily::Gray: base_channels = 1; break;
        case ColorFamily::RGB:  base_channels = 3; break;
        case ColorFamily::CMYK: base_channels = 4; break;
        default:
            Logger::log(LogLevel::Debug, "Indexed palette over unsupported base " + decl.name, "color_model");
            return std::nullopt;
    }

    const size_t entries = static_cast<size_t>(decl.hival) + 1;
    if (decl.lookup.size() < entries * base_channels) {
        Logger::log(LogLevel::Debug,
                    "Indexed lookup too short: " + std::to_string(decl.lookup.size()) +
                    " bytes for " + std::to_string(entries) + " entries",
                    "color_model");
        return std::nullopt;
    }

    Palette palette;
    palette.hival = decl.hival;

    if (base_channels == 1) {
        palette.channels = 1;
        palette.entries.assign(decl.lookup.begin(), decl.lookup.begin() + static_cast<std::ptrdiff_t>(entries));
        return palette;
    }

    std::vector<unsigned char> rgb(entries * 3);
    if (base_channels == 4) {
        for (size_t i = 0; i < entries; ++i) {
            cmyk_to_rgb_pixel(&decl.lookup[i * 4], &rgb[i * 3]);
        }
    } else {
        std::copy_n(decl.lookup.begin(), entries * 3, rgb.begin());
    }

    if (palette_is_neutral(rgb)) {
        palette.channels = 1;
        palette.entries.resize(entries);
        for (size_t i = 0; i < entries; ++i) {
            palette.entries[i] = rgb[i * 3];
        }
    } else {
        palette.channels = 3;
        palette.entries = std::move(rgb);
    }
    return palette;
}

std::optional<ColorModel> resolve_color_model(const ColorSpaceDecl& decl,
                                              const std::optional<int> bits_per_component) {
    switch (decl.family) {
        case ColorFamily::Gray:
            return GrayModel{};
        case ColorFamily::RGB:
            return RgbModel{};
        case ColorFamily::CMYK:
            return CmykModel{};
        case ColorFamily::Indexed:
            if (auto palette = build_palette(decl)) {
                return IndexedModel{std::move(*palette)};
            }
            return std::nullopt;
        case ColorFamily::Unspecified:
            if (bits_per_component && *bits_per_component == 1) {
                return GrayModel{};
            }
            return std::nullopt;
        case ColorFamily::Other:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace pdfshrink
