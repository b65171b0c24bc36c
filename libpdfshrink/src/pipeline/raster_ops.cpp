//
// Sample-level raster transforms.
//

#include "../../include/raster_ops.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize.h>

namespace pdfshrink {

size_t packed_size(const int width, const int height, const int channels,
                   const int bits_per_component) noexcept {
    if (width <= 0 || height <= 0 || channels <= 0 || bits_per_component <= 0) {
        return 0;
    }
    const size_t row_bits = static_cast<size_t>(width) * channels * bits_per_component;
    return static_cast<size_t>(height) * ((row_bits + 7) / 8);
}

std::vector<unsigned char> unpack_samples(const std::span<const unsigned char> packed,
                                          const int width, const int height, const int channels,
                                          const int bits_per_component, const bool scale) {
    if (bits_per_component == 8 || bits_per_component == 16) {
        return {packed.begin(), packed.end()};
    }

    const size_t samples_per_row = static_cast<size_t>(width) * channels;
    const size_t row_bytes = (samples_per_row * bits_per_component + 7) / 8;
    const unsigned max_value = (1u << bits_per_component) - 1u;
    const unsigned mask = max_value;

    std::vector<unsigned char> out(samples_per_row * height);
    for (int y = 0; y < height; ++y) {
        const unsigned char* row = packed.data() + row_bytes * y;
        unsigned char* dst = out.data() + samples_per_row * y;
        for (size_t i = 0; i < samples_per_row; ++i) {
            const size_t bit = i * bits_per_component;
            const unsigned shift = 8u - static_cast<unsigned>(bits_per_component) - static_cast<unsigned>(bit % 8);
            const unsigned v = (row[bit / 8] >> shift) & mask;
            dst[i] = static_cast<unsigned char>(scale ? v * 255u / max_value : v);
        }
    }
    return out;
}

std::vector<unsigned char> expand_palette(const std::span<const unsigned char> indices,
                                          const Palette& palette) {
    const auto channels = static_cast<size_t>(palette.channels);
    std::vector<unsigned char> out(indices.size() * channels);
    for (size_t i = 0; i < indices.size(); ++i) {
        const size_t index = std::min<size_t>(indices[i], static_cast<size_t>(palette.hival));
        std::copy_n(palette.entries.begin() + static_cast<std::ptrdiff_t>(index * channels),
                    channels,
                    out.begin() + static_cast<std::ptrdiff_t>(i * channels));
    }
    return out;
}

bool is_identity_decode(const std::span<const double> ranges, const int components,
                        const bool indexed, const int bits_per_component) noexcept {
    if (ranges.empty()) return true;
    if (ranges.size() != static_cast<size_t>(components) * 2) return false;
    const double high = indexed ? std::ldexp(1.0, bits_per_component) - 1.0 : 1.0;
    for (size_t i = 0; i < ranges.size(); i += 2) {
        if (ranges[i] != 0.0 || ranges[i + 1] != high) return false;
    }
    return true;
}

void apply_decode_ranges(std::vector<unsigned char>& samples, const int channels,
                         const std::span<const double> ranges) {
    const auto n = static_cast<size_t>(channels);
    for (size_t i = 0; i < samples.size(); ++i) {
        const double lo = ranges[(i % n) * 2];
        const double hi = ranges[(i % n) * 2 + 1];
        const double v = (lo + samples[i] / 255.0 * (hi - lo)) * 255.0;
        samples[i] = static_cast<unsigned char>(std::clamp(std::lround(v), 0L, 255L));
    }
}

void remap_indices(std::vector<unsigned char>& indices, const int bits_per_component, const int hival,
                   const std::span<const double> range) {
    const double max_value = std::ldexp(1.0, bits_per_component) - 1.0;
    for (auto& index : indices) {
        const double v = range[0] + index * (range[1] - range[0]) / max_value;
        index = static_cast<unsigned char>(std::clamp(std::lround(v), 0L, static_cast<long>(hival)));
    }
}

void reduce_to_8bit(DecodedRaster& raster) {
    if (raster.bit_depth <= 8) {
        return;
    }
    const size_t samples = raster.pixels.size() / 2;
    for (size_t i = 0; i < samples; ++i) {
        raster.pixels[i] = raster.pixels[i * 2];
    }
    raster.pixels.resize(samples);
    raster.bit_depth = 8;
}

void convert_cmyk_to_rgb(DecodedRaster& raster) {
    const size_t pixels = static_cast<size_t>(raster.width) * raster.height;
    std::vector<unsigned char> rgb(pixels * 3);
    // an explicit /Decode supersedes the Adobe marker
    const bool ranges = !raster.decode.empty();
    if (ranges) {
        apply_decode_ranges(raster.pixels, 4, raster.decode);
    }
    for (size_t i = 0; i < pixels; ++i) {
        unsigned char* cmyk = &raster.pixels[i * 4];
        if (raster.adobe_cmyk && !ranges) {
            for (int c = 0; c < 4; ++c) cmyk[c] = static_cast<unsigned char>(255 - cmyk[c]);
        }
        cmyk_to_rgb_pixel(cmyk, &rgb[i * 3]);
    }
    raster.pixels = std::move(rgb);
    raster.channels = 3;
    raster.model = RgbModel{};
    raster.adobe_cmyk = false;
    raster.decode.clear();
}

std::pair<int, int> fit_within(const int width, const int height,
                               const std::optional<int> max_width,
                               const std::optional<int> max_height) noexcept {
    double scale = 1.0;
    if (max_width && width > *max_width) {
        scale = std::min(scale, static_cast<double>(*max_width) / width);
    }
    if (max_height && height > *max_height) {
        scale = std::min(scale, static_cast<double>(*max_height) / height);
    }
    if (scale >= 1.0) {
        return {width, height};
    }
    // floor keeps the result inside the bound
    const int w = std::max(1, static_cast<int>(std::floor(width * scale)));
    const int h = std::max(1, static_cast<int>(std::floor(height * scale)));
    return {w, h};
}

bool resize_raster(DecodedRaster& raster, const int new_width, const int new_height) {
    if (raster.bit_depth != 8 || new_width <= 0 || new_height <= 0) {
        return false;
    }
    if (new_width == raster.width && new_height == raster.height) {
        return true;
    }

    std::vector<unsigned char> resized(static_cast<size_t>(new_width) * new_height * raster.channels);
    const bool linear = std::holds_alternative<CmykModel>(raster.model);

    int ok;
    if (linear) {
        ok = stbir_resize_uint8(raster.pixels.data(), raster.width, raster.height,
                                raster.width * raster.channels,
                                resized.data(), new_width, new_height,
                                new_width * raster.channels,
                                raster.channels);
    } else {
        ok = stbir_resize_uint8_srgb(raster.pixels.data(), raster.width, raster.height,
                                     raster.width * raster.channels,
                                     resized.data(), new_width, new_height,
                                     new_width * raster.channels,
                                     raster.channels, STBIR_ALPHA_CHANNEL_NONE, 0);
    }
    if (!ok) {
        Logger::log(LogLevel::Warning,
                    "stb resize failed for " + std::to_string(raster.width) + "x" +
                    std::to_string(raster.height),
                    "recompressor");
        return false;
    }

    raster.pixels = std::move(resized);
    raster.width = new_width;
    raster.height = new_height;
    return true;
}

} // namespace pdfshrink
