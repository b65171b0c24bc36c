#include <catch2/catch.hpp>

#include "../include/image_decoder.hpp"
#include "../include/jpeg_codec.hpp"
#include "../include/pipeline_errors.hpp"
#include "test_pdf_builder.hpp"
#include <stdexcept>

using namespace pdfshrink;

namespace {

ImageResource make_resource(const int width, const int height, const ColorFamily family, const int bpc,
                            std::vector<std::string> filters, std::vector<unsigned char> raw) {
    ImageResource resource;
    resource.label = "test";
    resource.page = 1;
    resource.width = width;
    resource.height = height;
    resource.bits_per_component = bpc;
    resource.filters = std::move(filters);
    resource.raw = std::move(raw);
    resource.color_space.family = family;
    switch (family) {
        case ColorFamily::Gray: resource.color_space.name = "/DeviceGray"; resource.color_space.components = 1; break;
        case ColorFamily::RGB:  resource.color_space.name = "/DeviceRGB";  resource.color_space.components = 3; break;
        case ColorFamily::CMYK: resource.color_space.name = "/DeviceCMYK"; resource.color_space.components = 4; break;
        default: break;
    }
    return resource;
}

const std::vector<DecodeStrategyKind> kDefaultOrder{
    DecodeStrategyKind::Direct, DecodeStrategyKind::EmbeddedJpeg, DecodeStrategyKind::Generic};

} // namespace

TEST_CASE("Direct strategy") {
    const ColorPreservingDecoder decoder(kDefaultOrder);
    const auto samples = test::noisy_samples(20, 10, 3);

    SECTION("Flate RGB keeps three channels") {
        const auto resource = make_resource(20, 10, ColorFamily::RGB, 8, {"/FlateDecode"}, test::deflate_bytes(samples));
        const auto result = decoder.decode(resource, FormatSniffer::classify(resource));
        REQUIRE(result.strategy == DecodeStrategyKind::Direct);
        REQUIRE(result.raster.channels == 3);
        REQUIRE(std::holds_alternative<RgbModel>(result.raster.model));
        REQUIRE(result.raster.pixels == samples);
    }

    SECTION("Unfiltered gray data") {
        const auto gray = test::noisy_samples(20, 10, 1);
        const auto resource = make_resource(20, 10, ColorFamily::Gray, 8, {}, gray);
        const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
        REQUIRE(result.raster.channels == 1);
        REQUIRE(result.raster.pixels == gray);
    }

    SECTION("Truncated data fails instead of padding") {
        auto truncated = test::deflate_bytes(samples);
        truncated.resize(truncated.size() / 2);
        const auto resource = make_resource(20, 10, ColorFamily::RGB, 8, {"/FlateDecode"}, truncated);
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::RawFlateRaster), DecodeError);
    }

    SECTION("Too much data fails") {
        auto longer = samples;
        longer.resize(samples.size() + 60);
        const auto resource = make_resource(20, 10, ColorFamily::RGB, 8, {"/FlateDecode"}, test::deflate_bytes(longer));
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::RawFlateRaster), DecodeError);
    }

    SECTION("Predictors are left to other strategies") {
        auto resource = make_resource(20, 10, ColorFamily::RGB, 8, {"/FlateDecode"}, test::deflate_bytes(samples));
        resource.predictor = 15;
        REQUIRE_FALSE(DirectRasterStrategy().applies_to(resource, ImageEncoding::RawFlateRaster));
    }
}

TEST_CASE("Indexed images are expanded through their palette") {
    auto resource = make_resource(4, 1, ColorFamily::Indexed, 8, {"/FlateDecode"},
                                  test::deflate_bytes({0, 1, 1, 0}));
    resource.color_space.name = "/Indexed";
    resource.color_space.components = 1;
    resource.color_space.base_family = ColorFamily::RGB;
    resource.color_space.base_components = 3;
    resource.color_space.hival = 1;
    resource.color_space.lookup = {255, 0, 0, 0, 0, 255};

    const ColorPreservingDecoder decoder(kDefaultOrder);
    const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
    REQUIRE(result.raster.channels == 3);
    REQUIRE(std::holds_alternative<IndexedModel>(result.raster.source_model));
    REQUIRE(std::holds_alternative<RgbModel>(result.raster.model));
    REQUIRE(result.raster.pixels ==
            std::vector<unsigned char>{255, 0, 0, 0, 0, 255, 0, 0, 255, 255, 0, 0});

    SECTION("Unusable palette is a decode failure") {
        resource.color_space.lookup.resize(3);
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::RawFlateRaster), DecodeError);
    }
}

TEST_CASE("Decode arrays are honored") {
    const ColorPreservingDecoder decoder({DecodeStrategyKind::Direct});

    SECTION("Inverted index range swaps palette entries") {
        auto resource = make_resource(4, 1, ColorFamily::Indexed, 1, {}, {0x60});
        resource.color_space.name = "/Indexed";
        resource.color_space.components = 1;
        resource.color_space.base_family = ColorFamily::RGB;
        resource.color_space.base_components = 3;
        resource.color_space.hival = 1;
        resource.color_space.lookup = {255, 0, 0, 0, 0, 255};
        resource.decode = {1, 0};

        const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
        REQUIRE(result.raster.decode.empty());
        REQUIRE(result.raster.pixels ==
                std::vector<unsigned char>{0, 0, 255, 255, 0, 0, 255, 0, 0, 0, 0, 255});
    }

    SECTION("Color ranges travel with the raster") {
        const auto samples = test::noisy_samples(6, 4, 4);
        auto resource = make_resource(6, 4, ColorFamily::CMYK, 8, {"/FlateDecode"}, test::deflate_bytes(samples));
        resource.decode = {1, 0, 1, 0, 1, 0, 1, 0};
        const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
        REQUIRE(result.raster.pixels == samples);
        REQUIRE(result.raster.decode == resource.decode);
    }

    SECTION("Default ranges are dropped") {
        const auto samples = test::noisy_samples(6, 4, 1);
        auto resource = make_resource(6, 4, ColorFamily::Gray, 8, {}, samples);
        resource.decode = {0, 1};
        const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
        REQUIRE(result.raster.decode.empty());
    }

    SECTION("Wrong number of entries fails") {
        const auto samples = test::noisy_samples(6, 4, 3);
        auto resource = make_resource(6, 4, ColorFamily::RGB, 8, {}, samples);
        resource.decode = {1, 0};
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::RawFlateRaster), DecodeError);
    }
}

TEST_CASE("Embedded JPEG strategy") {
    const ColorPreservingDecoder decoder(kDefaultOrder);

    SECTION("CMYK JPEG decodes to four CMYK channels") {
        const auto jpeg = encode_jpeg(test::noisy_samples(16, 8, 4), 16, 8, JpegColor::Cmyk, 80);
        const auto resource = make_resource(16, 8, ColorFamily::CMYK, 8, {"/DCTDecode"}, jpeg);
        const auto result = decoder.decode(resource, FormatSniffer::classify(resource));
        REQUIRE(result.strategy == DecodeStrategyKind::EmbeddedJpeg);
        REQUIRE(result.raster.channels == 4);
        REQUIRE(std::holds_alternative<CmykModel>(result.raster.model));
    }

    SECTION("Component count must match the declared space") {
        const auto jpeg = encode_jpeg(test::noisy_samples(16, 8, 1), 16, 8, JpegColor::Gray, 80);
        const auto resource = make_resource(16, 8, ColorFamily::RGB, 8, {"/DCTDecode"}, jpeg);
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::EmbeddedJpeg), DecodeError);
    }

    SECTION("Missing color space is inferred from the stream") {
        const auto jpeg = encode_jpeg(test::noisy_samples(16, 8, 1), 16, 8, JpegColor::Gray, 80);
        auto resource = make_resource(16, 8, ColorFamily::Unspecified, 8, {"/DCTDecode"}, jpeg);
        const auto result = decoder.decode(resource, FormatSniffer::classify(resource));
        REQUIRE(std::holds_alternative<GrayModel>(result.raster.model));
    }

    SECTION("Dimension mismatch fails") {
        const auto jpeg = encode_jpeg(test::noisy_samples(16, 8, 3), 16, 8, JpegColor::Rgb, 80);
        const auto resource = make_resource(32, 8, ColorFamily::RGB, 8, {"/DCTDecode"}, jpeg);
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::EmbeddedJpeg), DecodeError);
    }
}

TEST_CASE("Generic strategy and chain order") {
    const auto samples = test::noisy_samples(10, 10, 1);
    auto resource = make_resource(10, 10, ColorFamily::Gray, 8, {"/ASCIIHexDecode", "/FlateDecode"}, {'x'});
    int fetches = 0;
    resource.fetch_decoded = [&fetches, &samples] {
        ++fetches;
        return samples;
    };

    SECTION("Multi-filter chains go through the PDF library") {
        const ColorPreservingDecoder decoder(kDefaultOrder);
        const auto result = decoder.decode(resource, ImageEncoding::RawFlateRaster);
        REQUIRE(result.strategy == DecodeStrategyKind::Generic);
        REQUIRE(fetches == 1);
        REQUIRE(result.raster.pixels == samples);
    }

    SECTION("Failing fetch is reported as a decode error") {
        resource.fetch_decoded = []() -> std::vector<unsigned char> {
            throw std::runtime_error("stream is damaged");
        };
        const ColorPreservingDecoder decoder(kDefaultOrder);
        REQUIRE_THROWS_WITH(decoder.decode(resource, ImageEncoding::RawFlateRaster),
                            Catch::Contains("all decode strategies failed"));
    }

    SECTION("Order without generic has nothing to try") {
        const ColorPreservingDecoder decoder({DecodeStrategyKind::Direct});
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::RawFlateRaster), DecodeError);
        REQUIRE(fetches == 0);
    }

    SECTION("Unsupported encodings are rejected up front") {
        const ColorPreservingDecoder decoder(kDefaultOrder);
        REQUIRE_THROWS_AS(decoder.decode(resource, ImageEncoding::Unsupported), DecodeError);
    }
}

TEST_CASE("Raster reinterpretation validates geometry") {
    const auto resource = make_resource(4, 2, ColorFamily::Gray, 1, {}, {});
    REQUIRE(raster_from_samples(std::vector<unsigned char>{0xF0, 0x0F}, resource, GrayModel{}).has_value());
    REQUIRE_FALSE(raster_from_samples(std::vector<unsigned char>{0xF0}, resource, GrayModel{}).has_value());
    REQUIRE_FALSE(raster_from_samples(std::vector<unsigned char>{0xF0, 0x0F}, resource, std::nullopt).has_value());

    auto odd_depth = make_resource(4, 2, ColorFamily::Gray, 3, {}, {});
    REQUIRE_FALSE(raster_from_samples(std::vector<unsigned char>{0, 0}, odd_depth, GrayModel{}).has_value());
}
