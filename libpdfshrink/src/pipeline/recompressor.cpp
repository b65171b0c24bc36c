//
// JPEG recompression of decoded rasters.
//

#include "../../include/recompressor.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/pipeline_errors.hpp"
#include "../../include/raster_ops.hpp"
#include <string>

namespace pdfshrink {

EncodedReplacement Recompressor::recompress(DecodedRaster raster) const {
    if (!raster.valid()) {
        throw EncodeError("raster buffer does not match " + std::to_string(raster.width) + "x" +
                          std::to_string(raster.height) + "x" + std::to_string(raster.channels));
    }

    reduce_to_8bit(raster);

    if (std::holds_alternative<CmykModel>(raster.model) &&
        policy_.cmyk_handling == CmykHandling::ConvertToRgb) {
        convert_cmyk_to_rgb(raster);
    }

    const auto [target_w, target_h] = fit_within(raster.width, raster.height,
                                                 policy_.max_width, policy_.max_height);
    if (target_w != raster.width || target_h != raster.height) {
        const int from_w = raster.width;
        const int from_h = raster.height;
        if (!resize_raster(raster, target_w, target_h)) {
            throw EncodeError("resampling to " + std::to_string(target_w) + "x" +
                              std::to_string(target_h) + " failed");
        }
        Logger::log(LogLevel::Debug,
                    "Resized " + std::to_string(from_w) + "x" + std::to_string(from_h) + " to " +
                    std::to_string(target_w) + "x" + std::to_string(target_h),
                    "recompressor");
    }

    EncodedReplacement out;
    out.width = raster.width;
    out.height = raster.height;
    out.bits_per_component = 8;

    JpegColor jpeg_color = JpegColor::Rgb;
    bool adobe = false;
    std::visit(overloaded{
        [&](const GrayModel&) {
            jpeg_color = JpegColor::Gray;
            out.color_space = OutputColorSpace::DeviceGray;
            out.quality = policy_.effective_grayscale_quality();
        },
        [&](const RgbModel&) {
            jpeg_color = JpegColor::Rgb;
            out.color_space = OutputColorSpace::DeviceRGB;
            out.quality = policy_.quality;
        },
        [&](const CmykModel&) {
            jpeg_color = JpegColor::Cmyk;
            out.color_space = OutputColorSpace::DeviceCMYK;
            out.quality = policy_.quality;
            adobe = raster.adobe_cmyk;
        },
        [&](const IndexedModel&) {
            throw EncodeError("palette raster reached the encoder unexpanded");
        },
    }, raster.model);

    if (components(out.color_space) != raster.channels) {
        throw EncodeError(std::string(model_name(raster.model)) + " raster has " +
                          std::to_string(raster.channels) + " channels");
    }

    out.data = encode_jpeg(raster.pixels, raster.width, raster.height, jpeg_color, out.quality, adobe);
    return out;
}

} // namespace pdfshrink
