#include <catch2/catch.hpp>

#include "../include/color_model.hpp"

using namespace pdfshrink;

namespace {
ColorSpaceDecl indexed(const ColorFamily base, const int base_components, const int hival,
                       std::vector<unsigned char> lookup) {
    ColorSpaceDecl decl;
    decl.family = ColorFamily::Indexed;
    decl.name = "/Indexed";
    decl.components = 1;
    decl.base_family = base;
    decl.base_components = base_components;
    decl.hival = hival;
    decl.lookup = std::move(lookup);
    return decl;
}
} // namespace

TEST_CASE("Resolve declared color models") {
    ColorSpaceDecl decl;

    SECTION("Device families map one to one") {
        decl.family = ColorFamily::Gray;
        REQUIRE(std::holds_alternative<GrayModel>(*resolve_color_model(decl, 8)));
        decl.family = ColorFamily::RGB;
        REQUIRE(std::holds_alternative<RgbModel>(*resolve_color_model(decl, 8)));
        decl.family = ColorFamily::CMYK;
        const auto cmyk = resolve_color_model(decl, 8);
        REQUIRE(std::holds_alternative<CmykModel>(*cmyk));
        REQUIRE(sample_channels(*cmyk) == 4);
        REQUIRE(output_channels(*cmyk) == 4);
    }

    SECTION("Missing declaration only resolves for 1-bit data") {
        REQUIRE(resolve_color_model(decl, 1).has_value());
        REQUIRE_FALSE(resolve_color_model(decl, 8).has_value());
        REQUIRE_FALSE(resolve_color_model(decl, std::nullopt).has_value());
    }

    SECTION("Other families are unsupported") {
        decl.family = ColorFamily::Other;
        decl.name = "/Lab";
        REQUIRE_FALSE(resolve_color_model(decl, 8).has_value());
    }
}

TEST_CASE("Build palettes") {
    SECTION("RGB palette keeps its entries") {
        const auto decl = indexed(ColorFamily::RGB, 3, 1, {255, 0, 0, 0, 0, 255});
        const auto model = resolve_color_model(decl, 8);
        REQUIRE(model.has_value());
        REQUIRE(sample_channels(*model) == 1);
        REQUIRE(output_channels(*model) == 3);
        REQUIRE(model_name(*model) == "Indexed");
        const auto& palette = std::get<IndexedModel>(*model).palette;
        REQUIRE(palette.entries == std::vector<unsigned char>{255, 0, 0, 0, 0, 255});
    }

    SECTION("Neutral palette collapses to gray") {
        const auto palette = build_palette(indexed(ColorFamily::RGB, 3, 2, {0, 0, 0, 128, 128, 128, 255, 255, 255}));
        REQUIRE(palette.has_value());
        REQUIRE(palette->channels == 1);
        REQUIRE(palette->entries == std::vector<unsigned char>{0, 128, 255});
    }

    SECTION("CMYK palette is converted to RGB") {
        const auto palette = build_palette(indexed(ColorFamily::CMYK, 4, 1, {255, 0, 0, 0, 0, 0, 0, 255}));
        REQUIRE(palette.has_value());
        REQUIRE(palette->channels == 3);
        // cyan, then black
        REQUIRE(palette->entries == std::vector<unsigned char>{0, 255, 255, 0, 0, 0});
    }

    SECTION("Short lookup table is rejected") {
        REQUIRE_FALSE(build_palette(indexed(ColorFamily::RGB, 3, 3, {1, 2, 3})).has_value());
    }

    SECTION("Unsupported base is rejected") {
        REQUIRE_FALSE(build_palette(indexed(ColorFamily::Other, 0, 0, {0})).has_value());
    }
}

TEST_CASE("CMYK pixel conversion") {
    const unsigned char white[4] = {0, 0, 0, 0};
    const unsigned char black[4] = {0, 0, 0, 255};
    unsigned char rgb[3];
    cmyk_to_rgb_pixel(white, rgb);
    REQUIRE((rgb[0] == 255 && rgb[1] == 255 && rgb[2] == 255));
    cmyk_to_rgb_pixel(black, rgb);
    REQUIRE((rgb[0] == 0 && rgb[1] == 0 && rgb[2] == 0));
}
