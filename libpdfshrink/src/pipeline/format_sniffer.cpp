//
// Filter chain classification.
//

#include "../../include/format_sniffer.hpp"
#include <algorithm>
#include <array>

namespace {

constexpr std::array<std::string_view, 10> kLosslessFilters = {
    "/FlateDecode", "/Fl",
    "/LZWDecode", "/LZW",
    "/RunLengthDecode", "/RL",
    "/ASCIIHexDecode", "/AHx",
    "/ASCII85Decode", "/A85"
};

} // namespace

namespace pdfshrink {

bool FormatSniffer::is_lossless_filter(const std::string_view name) noexcept {
    return std::ranges::find(kLosslessFilters, name) != kLosslessFilters.end();
}

bool FormatSniffer::is_dct_filter(const std::string_view name) noexcept {
    return name == "/DCTDecode" || name == "/DCT";
}

ImageEncoding FormatSniffer::classify(const std::vector<std::string>& filters,
                                      const ColorSpaceDecl& color_space) noexcept {
    if (std::ranges::any_of(filters, [](const std::string& f) { return is_dct_filter(f); })) {
        return ImageEncoding::EmbeddedJpeg;
    }
    if (filters.empty()) {
        return color_space.family != ColorFamily::Unspecified
                   ? ImageEncoding::RawFlateRaster
                   : ImageEncoding::Unsupported;
    }
    // only the outermost filter decides; inner ones are the decoder's concern
    if (is_lossless_filter(filters.front())) {
        return ImageEncoding::RawFlateRaster;
    }
    return ImageEncoding::Unsupported;
}

} // namespace pdfshrink
