#include <catch2/catch.hpp>

#include "../include/format_sniffer.hpp"

using namespace pdfshrink;

namespace {
ColorSpaceDecl rgb_decl() {
    ColorSpaceDecl decl;
    decl.family = ColorFamily::RGB;
    decl.name = "/DeviceRGB";
    decl.components = 3;
    return decl;
}
} // namespace

TEST_CASE("Classify filter chains") {
    const ColorSpaceDecl rgb = rgb_decl();

    SECTION("Lossless chains are raw rasters") {
        REQUIRE(FormatSniffer::classify({"/FlateDecode"}, rgb) == ImageEncoding::RawFlateRaster);
        REQUIRE(FormatSniffer::classify({"/Fl"}, rgb) == ImageEncoding::RawFlateRaster);
        REQUIRE(FormatSniffer::classify({"/LZWDecode"}, rgb) == ImageEncoding::RawFlateRaster);
        REQUIRE(FormatSniffer::classify({"/ASCIIHexDecode", "/FlateDecode"}, rgb) ==
                ImageEncoding::RawFlateRaster);
        REQUIRE(FormatSniffer::classify({"/RunLengthDecode"}, rgb) == ImageEncoding::RawFlateRaster);
    }

    SECTION("DCT anywhere in the chain is an embedded JPEG") {
        REQUIRE(FormatSniffer::classify({"/DCTDecode"}, rgb) == ImageEncoding::EmbeddedJpeg);
        REQUIRE(FormatSniffer::classify({"/DCT"}, rgb) == ImageEncoding::EmbeddedJpeg);
        REQUIRE(FormatSniffer::classify({"/FlateDecode", "/DCTDecode"}, rgb) == ImageEncoding::EmbeddedJpeg);
    }

    SECTION("Bilevel and wavelet codecs are unsupported") {
        REQUIRE(FormatSniffer::classify({"/JBIG2Decode"}, rgb) == ImageEncoding::Unsupported);
        REQUIRE(FormatSniffer::classify({"/JPXDecode"}, rgb) == ImageEncoding::Unsupported);
        REQUIRE(FormatSniffer::classify({"/CCITTFaxDecode"}, rgb) == ImageEncoding::Unsupported);
        REQUIRE(FormatSniffer::classify({"/Crypt"}, rgb) == ImageEncoding::Unsupported);
        REQUIRE(FormatSniffer::classify({"/SomethingElse"}, rgb) == ImageEncoding::Unsupported);
    }

    SECTION("Empty chain depends on the color space declaration") {
        REQUIRE(FormatSniffer::classify({}, rgb) == ImageEncoding::RawFlateRaster);
        REQUIRE(FormatSniffer::classify({}, ColorSpaceDecl{}) == ImageEncoding::Unsupported);
    }
}

TEST_CASE("Filter name predicates") {
    REQUIRE(FormatSniffer::is_lossless_filter("/AHx"));
    REQUIRE(FormatSniffer::is_lossless_filter("/A85"));
    REQUIRE_FALSE(FormatSniffer::is_lossless_filter("/DCTDecode"));
    REQUIRE(FormatSniffer::is_dct_filter("/DCTDecode"));
    REQUIRE_FALSE(FormatSniffer::is_dct_filter("/JPXDecode"));
    REQUIRE(to_string(ImageEncoding::EmbeddedJpeg) == "jpeg");
}
