#include <catch2/catch.hpp>

#include "../include/raster_ops.hpp"
#include "test_pdf_builder.hpp"

using namespace pdfshrink;

TEST_CASE("Packed sizes pad rows to whole bytes") {
    REQUIRE(packed_size(8, 2, 1, 1) == 2);
    REQUIRE(packed_size(9, 2, 1, 1) == 4);
    REQUIRE(packed_size(3, 3, 3, 8) == 27);
    REQUIRE(packed_size(2, 2, 1, 16) == 8);
    REQUIRE(packed_size(5, 1, 1, 4) == 3);
}

TEST_CASE("Unpack sub-byte samples") {
    SECTION("1 bit gray is scaled to 0 and 255") {
        const std::vector<unsigned char> packed{0b10100000};
        const auto out = unpack_samples(packed, 3, 1, 1, 1, true);
        REQUIRE(out == std::vector<unsigned char>{255, 0, 255});
    }

    SECTION("4 bit indices keep their values") {
        const std::vector<unsigned char> packed{0x1F, 0x20};
        const auto out = unpack_samples(packed, 3, 1, 1, 4, false);
        REQUIRE(out == std::vector<unsigned char>{1, 15, 2});
    }

    SECTION("Rows start on byte boundaries") {
        const std::vector<unsigned char> packed{0b11000000, 0b01000000};
        const auto out = unpack_samples(packed, 2, 2, 1, 2, true);
        REQUIRE(out == std::vector<unsigned char>{255, 0, 85, 0});
    }

    SECTION("8 bit data is copied") {
        const std::vector<unsigned char> packed{1, 2, 3};
        REQUIRE(unpack_samples(packed, 3, 1, 1, 8, true) == packed);
    }
}

TEST_CASE("Expand palette indices") {
    Palette palette;
    palette.channels = 3;
    palette.hival = 1;
    palette.entries = {10, 20, 30, 40, 50, 60};
    const std::vector<unsigned char> indices{1, 0, 7};
    // index 7 is out of range and clamps to hival
    REQUIRE(expand_palette(indices, palette) ==
            std::vector<unsigned char>{40, 50, 60, 10, 20, 30, 40, 50, 60});
}

TEST_CASE("Decode arrays") {
    SECTION("Defaults are recognized") {
        REQUIRE(is_identity_decode({}, 3, false, 8));
        REQUIRE(is_identity_decode(std::vector<double>{0, 1, 0, 1, 0, 1}, 3, false, 8));
        REQUIRE(is_identity_decode(std::vector<double>{0, 15}, 1, true, 4));
        REQUIRE_FALSE(is_identity_decode(std::vector<double>{0, 1}, 1, true, 4));
        REQUIRE_FALSE(is_identity_decode(std::vector<double>{1, 0}, 1, false, 8));
        REQUIRE_FALSE(is_identity_decode(std::vector<double>{0, 1}, 3, false, 8));
    }

    SECTION("Inverted ranges flip samples per channel") {
        std::vector<unsigned char> samples{0, 255, 10, 200};
        const std::vector<double> ranges{1, 0, 0, 1};
        apply_decode_ranges(samples, 2, ranges);
        REQUIRE(samples == std::vector<unsigned char>{255, 255, 245, 200});
    }

    SECTION("Indexed ranges remap and clamp indices") {
        std::vector<unsigned char> indices{0, 1};
        remap_indices(indices, 1, 1, std::vector<double>{1, 0});
        REQUIRE(indices == std::vector<unsigned char>{1, 0});

        std::vector<unsigned char> wide{0, 3};
        remap_indices(wide, 2, 2, std::vector<double>{0, 6});
        REQUIRE(wide == std::vector<unsigned char>{0, 2});
    }
}

TEST_CASE("Reduce 16 bit samples") {
    DecodedRaster raster;
    raster.width = 2;
    raster.height = 1;
    raster.channels = 1;
    raster.bit_depth = 16;
    raster.pixels = {0xAB, 0xCD, 0x12, 0x34};
    reduce_to_8bit(raster);
    REQUIRE(raster.bit_depth == 8);
    REQUIRE(raster.pixels == std::vector<unsigned char>{0xAB, 0x12});
    REQUIRE(raster.valid());
}

TEST_CASE("Convert CMYK rasters to RGB") {
    DecodedRaster raster;
    raster.width = 2;
    raster.height = 1;
    raster.channels = 4;
    raster.model = CmykModel{};

    SECTION("Plain CMYK") {
        raster.pixels = {0, 0, 0, 0, 0, 0, 0, 255};
        convert_cmyk_to_rgb(raster);
        REQUIRE(raster.channels == 3);
        REQUIRE(std::holds_alternative<RgbModel>(raster.model));
        REQUIRE(raster.pixels == std::vector<unsigned char>{255, 255, 255, 0, 0, 0});
    }

    SECTION("Adobe inverted CMYK") {
        raster.adobe_cmyk = true;
        raster.pixels = {255, 255, 255, 255, 255, 255, 255, 0};
        convert_cmyk_to_rgb(raster);
        REQUIRE_FALSE(raster.adobe_cmyk);
        REQUIRE(raster.pixels == std::vector<unsigned char>{255, 255, 255, 0, 0, 0});
    }

    SECTION("Decode ranges replace the Adobe inversion") {
        raster.adobe_cmyk = true;
        raster.decode = {1, 0, 1, 0, 1, 0, 1, 0};
        raster.pixels = {255, 255, 255, 255, 255, 255, 255, 0};
        convert_cmyk_to_rgb(raster);
        REQUIRE(raster.decode.empty());
        REQUIRE(raster.pixels == std::vector<unsigned char>{255, 255, 255, 0, 0, 0});
    }

    SECTION("Decode ranges apply to plain CMYK") {
        raster.decode = {1, 0, 1, 0, 1, 0, 1, 0};
        raster.pixels = {0, 0, 0, 0, 255, 255, 255, 255};
        convert_cmyk_to_rgb(raster);
        REQUIRE(raster.pixels == std::vector<unsigned char>{0, 0, 0, 255, 255, 255});
    }
}

TEST_CASE("Fit dimensions within bounds") {
    REQUIRE(fit_within(800, 600, 1200, 1200) == std::pair{800, 600});
    REQUIRE(fit_within(2400, 1000, 1200, 1200) == std::pair{1200, 500});
    REQUIRE(fit_within(1000, 3000, 1200, 1200) == std::pair{400, 1200});
    REQUIRE(fit_within(5000, 10, 1200, std::nullopt) == std::pair{1200, 2});
    REQUIRE(fit_within(10000, 1, 100, 100) == std::pair{100, 1});
    REQUIRE(fit_within(5000, 5000, std::nullopt, std::nullopt) == std::pair{5000, 5000});
}

TEST_CASE("Resize rasters") {
    DecodedRaster raster;
    raster.width = 64;
    raster.height = 32;
    raster.channels = 3;
    raster.model = RgbModel{};
    raster.pixels = test::noisy_samples(64, 32, 3);

    REQUIRE(resize_raster(raster, 32, 16));
    REQUIRE(raster.width == 32);
    REQUIRE(raster.height == 16);
    REQUIRE(raster.valid());

    DecodedRaster cmyk;
    cmyk.width = 40;
    cmyk.height = 40;
    cmyk.channels = 4;
    cmyk.model = CmykModel{};
    cmyk.pixels = test::noisy_samples(40, 40, 4);
    REQUIRE(resize_raster(cmyk, 10, 10));
    REQUIRE(cmyk.channels == 4);
    REQUIRE(cmyk.valid());

    cmyk.bit_depth = 16;
    REQUIRE_FALSE(resize_raster(cmyk, 5, 5));
}
