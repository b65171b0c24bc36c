//
// Decode strategies and the color-preserving decoder chain.
//

#include "../../include/image_decoder.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/pipeline_errors.hpp"
#include "../../include/raster_ops.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace {

// inflate a zlib stream, giving up once the output exceeds limit bytes
std::optional<std::vector<unsigned char>> inflate_bounded(const std::vector<unsigned char>& data,
                                                          const size_t limit) {
    std::vector<unsigned char> out(limit + 1);

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    if (inflateInit(&strm) != Z_OK) {
        return std::nullopt;
    }

    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret;
    do {
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            inflateEnd(&strm);
            Logger::log(LogLevel::Debug, "inflate failed: " + std::string(strm.msg ? strm.msg : "data error"),
                        "decoder");
            return std::nullopt;
        }
        if (ret == Z_BUF_ERROR) {
            // output full or input exhausted before stream end
            break;
        }
    } while (ret != Z_STREAM_END && strm.avail_out > 0);

    const size_t produced = strm.total_out;
    inflateEnd(&strm);
    out.resize(produced);
    return out;
}

bool is_flate(const std::string& name) {
    return name == "/FlateDecode" || name == "/Fl";
}

} // namespace

namespace pdfshrink {

std::optional<DecodedRaster> raster_from_samples(const std::span<const unsigned char> samples,
                                                 const ImageResource& resource,
                                                 const std::optional<ColorModel>& model) {
    if (!model) {
        Logger::log(LogLevel::Debug, resource.label + ": color model undetermined", "decoder");
        return std::nullopt;
    }
    if (!resource.bits_per_component) {
        Logger::log(LogLevel::Debug, resource.label + ": no /BitsPerComponent", "decoder");
        return std::nullopt;
    }

    const int bpc = *resource.bits_per_component;
    const bool indexed = std::holds_alternative<IndexedModel>(*model);
    const bool depth_ok = bpc == 1 || bpc == 2 || bpc == 4 || bpc == 8 || (bpc == 16 && !indexed);
    if (!depth_ok) {
        Logger::log(LogLevel::Debug, resource.label + ": unsupported depth " + std::to_string(bpc), "decoder");
        return std::nullopt;
    }

    const int channels = sample_channels(*model);
    const size_t expected = packed_size(resource.width, resource.height, channels, bpc);
    if (samples.size() != expected) {
        Logger::log(LogLevel::Debug,
                    resource.label + ": decoded " + std::to_string(samples.size()) +
                    " bytes, geometry needs " + std::to_string(expected),
                    "decoder");
        return std::nullopt;
    }

    if (!resource.decode.empty() && resource.decode.size() != static_cast<size_t>(channels) * 2) {
        Logger::log(LogLevel::Debug,
                    resource.label + ": /Decode has " + std::to_string(resource.decode.size()) +
                    " entries for " + std::to_string(channels) + " components",
                    "decoder");
        return std::nullopt;
    }
    const bool identity = is_identity_decode(resource.decode, channels, indexed, bpc);

    DecodedRaster raster;
    raster.width = resource.width;
    raster.height = resource.height;
    raster.source_model = *model;
    raster.bit_depth = bpc == 16 ? 16 : 8;

    auto unpacked = unpack_samples(samples, resource.width, resource.height, channels, bpc, !indexed);

    std::visit(overloaded{
        [&](const IndexedModel& m) {
            // the rewritten image has no palette, so the index mapping is applied here
            if (!identity) {
                remap_indices(unpacked, bpc, m.palette.hival, resource.decode);
            }
            raster.pixels = expand_palette(unpacked, m.palette);
            raster.channels = m.palette.channels;
            if (m.palette.channels == 1) {
                raster.model = GrayModel{};
            } else {
                raster.model = RgbModel{};
            }
        },
        [&](const auto& m) {
            raster.pixels = std::move(unpacked);
            raster.channels = channels;
            raster.model = m;
            if (!identity) {
                raster.decode = resource.decode;
            }
        },
    }, *model);

    if (!raster.valid()) {
        return std::nullopt;
    }
    return raster;
}

// --- direct ---

bool DirectRasterStrategy::applies_to(const ImageResource& resource,
                                      const ImageEncoding encoding) const noexcept {
    if (encoding != ImageEncoding::RawFlateRaster) return false;
    if (resource.filters.empty()) return true;
    return resource.filters.size() == 1 && is_flate(resource.filters.front()) && resource.predictor <= 1;
}

std::optional<DecodedRaster> DirectRasterStrategy::decode(const ImageResource& resource,
                                                          const std::optional<ColorModel>& model) const {
    if (resource.filters.empty()) {
        return raster_from_samples(resource.raw, resource, model);
    }
    if (!model || !resource.bits_per_component) {
        return std::nullopt;
    }

    const size_t expected = packed_size(resource.width, resource.height,
                                        sample_channels(*model), *resource.bits_per_component);
    if (expected == 0) {
        return std::nullopt;
    }
    const auto inflated = inflate_bounded(resource.raw, expected);
    if (!inflated) {
        return std::nullopt;
    }
    return raster_from_samples(*inflated, resource, model);
}

// --- embedded jpeg ---

bool EmbeddedJpegStrategy::applies_to(const ImageResource& resource,
                                      const ImageEncoding encoding) const noexcept {
    return encoding == ImageEncoding::EmbeddedJpeg &&
           resource.filters.size() == 1 &&
           FormatSniffer::is_dct_filter(resource.filters.front());
}

std::optional<DecodedRaster> EmbeddedJpegStrategy::decode(const ImageResource& resource,
                                                          const std::optional<ColorModel>& model) const {
    auto image = decode_jpeg(resource.raw);
    if (!image) {
        return std::nullopt;
    }

    if (image->width != resource.width || image->height != resource.height) {
        Logger::log(LogLevel::Debug,
                    resource.label + ": JPEG is " + std::to_string(image->width) + "x" +
                    std::to_string(image->height) + ", dictionary says " +
                    std::to_string(resource.width) + "x" + std::to_string(resource.height),
                    "decoder");
        return std::nullopt;
    }

    ColorModel resolved;
    if (model) {
        if (std::holds_alternative<IndexedModel>(*model) || output_channels(*model) != image->components) {
            Logger::log(LogLevel::Debug,
                        resource.label + ": JPEG has " + std::to_string(image->components) +
                        " components, color space is " + std::string(model_name(*model)),
                        "decoder");
            return std::nullopt;
        }
        resolved = *model;
    } else if (resource.color_space.family == ColorFamily::Unspecified) {
        switch (image->components) {
            case 1: resolved = GrayModel{}; break;
            case 3: resolved = RgbModel{}; break;
            case 4: resolved = CmykModel{}; break;
            default: return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!resource.decode.empty() && resource.decode.size() != static_cast<size_t>(image->components) * 2) {
        return std::nullopt;
    }

    DecodedRaster raster;
    raster.pixels = std::move(image->pixels);
    raster.width = image->width;
    raster.height = image->height;
    raster.channels = image->components;
    raster.bit_depth = 8;
    raster.model = resolved;
    raster.source_model = resolved;
    raster.adobe_cmyk = image->cmyk && image->adobe;
    if (!is_identity_decode(resource.decode, image->components, false, 8)) {
        raster.decode = resource.decode;
    }

    if (!raster.valid()) {
        return std::nullopt;
    }
    return raster;
}

// --- generic ---

bool GenericExtractionStrategy::applies_to(const ImageResource& resource,
                                           const ImageEncoding encoding) const noexcept {
    return encoding != ImageEncoding::Unsupported && static_cast<bool>(resource.fetch_decoded);
}

std::optional<DecodedRaster> GenericExtractionStrategy::decode(const ImageResource& resource,
                                                               const std::optional<ColorModel>& model) const {
    std::vector<unsigned char> samples;
    try {
        samples = resource.fetch_decoded();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, resource.label + ": qpdf could not decode: " + e.what(), "decoder");
        return std::nullopt;
    }
    if (samples.empty()) {
        return std::nullopt;
    }
    return raster_from_samples(samples, resource, model);
}

// --- chain ---

std::unique_ptr<IDecodeStrategy> ColorPreservingDecoder::make_strategy(const DecodeStrategyKind kind) {
    switch (kind) {
        case DecodeStrategyKind::Direct:       return std::make_unique<DirectRasterStrategy>();
        case DecodeStrategyKind::EmbeddedJpeg: return std::make_unique<EmbeddedJpegStrategy>();
        case DecodeStrategyKind::Generic:      return std::make_unique<GenericExtractionStrategy>();
    }
    throw std::invalid_argument("unknown decode strategy");
}

ColorPreservingDecoder::ColorPreservingDecoder(const std::vector<DecodeStrategyKind>& order) {
    strategies_.reserve(order.size());
    for (const auto kind : order) {
        strategies_.push_back(make_strategy(kind));
    }
}

DecodeResult ColorPreservingDecoder::decode(const ImageResource& resource, const ImageEncoding encoding) const {
    if (encoding == ImageEncoding::Unsupported) {
        throw DecodeError("unsupported filter chain " + resource.filter_string());
    }
    if (resource.color_space.family == ColorFamily::Other) {
        throw DecodeError("unsupported color space " + resource.color_space.name);
    }

    const auto model = resolve_color_model(resource.color_space, resource.bits_per_component);
    if (!model && resource.color_space.family == ColorFamily::Indexed) {
        throw DecodeError("unusable Indexed palette over " + resource.color_space.name);
    }

    std::string tried;
    for (const auto& strategy : strategies_) {
        if (!strategy->applies_to(resource, encoding)) {
            continue;
        }
        if (!tried.empty()) tried += ", ";
        tried += strategy->get_name();

        if (auto raster = strategy->decode(resource, model)) {
            if (Logger::enabled(LogLevel::Debug)) {
                Logger::log(LogLevel::Debug,
                            resource.label + ": decoded by " + std::string(strategy->get_name()) + " as " +
                            std::string(model_name(raster->model)) + " " + std::to_string(raster->width) + "x" +
                            std::to_string(raster->height) + " " + std::to_string(raster->bit_depth) + " bit",
                            "decoder");
            }
            return {std::move(*raster), strategy->kind()};
        }
    }

    if (tried.empty()) {
        throw DecodeError("no decode strategy applies to " + resource.filter_string());
    }
    throw DecodeError("all decode strategies failed (" + tried + ")");
}

} // namespace pdfshrink
