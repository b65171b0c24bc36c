#include <catch2/catch.hpp>

#include "../include/image_locator.hpp"
#include "test_pdf_builder.hpp"
#include <mutex>

using namespace pdfshrink;
using pdfshrink::test::TestPdfBuilder;

TEST_CASE("Locate images on pages") {
    TestPdfBuilder builder;
    const auto gray = test::noisy_samples(8, 4, 1);
    QPDFObjectHandle shared = builder.add_flate_image(8, 4, "/DeviceGray", 8, gray);
    QPDFObjectHandle rgb = builder.add_flate_image(8, 4, "/DeviceRGB", 8, test::noisy_samples(8, 4, 3));
    builder.add_page({shared, rgb});
    builder.add_page({shared});

    std::mutex document_mutex;
    const ImageLocator locator(builder.pdf(), document_mutex);
    const auto located = locator.collect();

    SECTION("Shared images are yielded once") {
        REQUIRE(located.images.size() == 2);
        REQUIRE(located.skipped.empty());
        REQUIRE(located.images[0].page == 1);
    }

    SECTION("Declared metadata is captured") {
        const auto& first = located.images[0];
        REQUIRE(first.width == 8);
        REQUIRE(first.height == 4);
        REQUIRE(first.bits_per_component == 8);
        REQUIRE(first.filters == std::vector<std::string>{"/FlateDecode"});
        REQUIRE(first.color_space.family == ColorFamily::Gray);
        REQUIRE(first.raw == test::deflate_bytes(gray));
        REQUIRE(first.label.find("/Im0") != std::string::npos);
    }

    SECTION("Decoded data is fetched through the library") {
        REQUIRE(located.images[0].fetch_decoded() == gray);
    }
}

TEST_CASE("Images inside form XObjects") {
    TestPdfBuilder builder;
    const auto gray = test::noisy_samples(6, 6, 1);
    QPDFObjectHandle image = builder.add_flate_image(6, 6, "/DeviceGray", 8, gray);

    QPDFObjectHandle form = QPDFObjectHandle::newStream(&builder.pdf(), "q 1 0 0 1 0 0 cm /Im0 Do Q\n");
    form.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    form.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    form.getDict().replaceKey("/BBox", QPDFObjectHandle::parse("[0 0 1 1]"));
    QPDFObjectHandle form_xobjects = QPDFObjectHandle::newDictionary();
    form_xobjects.replaceKey("/Im0", image);
    QPDFObjectHandle form_resources = QPDFObjectHandle::newDictionary();
    form_resources.replaceKey("/XObject", form_xobjects);
    form.getDict().replaceKey("/Resources", form_resources);

    builder.add_page({}, "cover");
    builder.add_page({form});
    builder.add_page({form});

    std::mutex document_mutex;
    const auto located = ImageLocator(builder.pdf(), document_mutex).collect();
    REQUIRE(located.images.size() == 1);
    REQUIRE(located.skipped.empty());
    REQUIRE(located.images[0].page == 2);
    REQUIRE(located.images[0].width == 6);
    REQUIRE(located.images[0].raw == test::deflate_bytes(gray));
}

TEST_CASE("Capture decode arrays") {
    TestPdfBuilder builder;
    QPDFObjectHandle inverted = builder.add_image("/Width 2 /Height 1 /ColorSpace /DeviceGray /BitsPerComponent 8 "
                                                  "/Decode [1 0]",
                                                  {10, 20}, "");
    QPDFObjectHandle plain = builder.add_image("/Width 2 /Height 1 /ColorSpace /DeviceGray /BitsPerComponent 8",
                                               {10, 20}, "");
    QPDFObjectHandle broken = builder.add_image("/Width 2 /Height 1 /ColorSpace /DeviceGray /BitsPerComponent 8 "
                                                "/Decode 5",
                                                {10, 20}, "");
    builder.add_page({inverted, plain, broken});

    std::mutex document_mutex;
    const auto located = ImageLocator(builder.pdf(), document_mutex).collect();
    REQUIRE(located.images.size() == 2);
    REQUIRE(located.images[0].decode == std::vector<double>{1, 0});
    REQUIRE(located.images[1].decode.empty());
    REQUIRE(located.skipped.size() == 1);
    REQUIRE(located.skipped[0].reason.find("/Decode") != std::string::npos);
}

TEST_CASE("Skip masks and malformed entries") {
    TestPdfBuilder builder;
    QPDFObjectHandle mask = builder.add_image("/Width 8 /Height 8 /ImageMask true /BitsPerComponent 1",
                                              std::vector<unsigned char>(8, 0xAA), "");
    QPDFObjectHandle no_width = builder.add_image("/Height 8 /ColorSpace /DeviceGray /BitsPerComponent 8",
                                                  std::vector<unsigned char>(64, 1), "");
    QPDFObjectHandle bad_cs = builder.add_image("/Width 2 /Height 2 /ColorSpace 42 /BitsPerComponent 8",
                                                std::vector<unsigned char>(4, 1), "");
    QPDFObjectHandle good = builder.add_flate_image(2, 2, "/DeviceGray", 8, {1, 2, 3, 4});
    builder.add_page({mask, no_width, bad_cs, good});

    std::mutex document_mutex;
    const auto located = ImageLocator(builder.pdf(), document_mutex).collect();
    REQUIRE(located.images.size() == 1);
    REQUIRE(located.images[0].width == 2);
    REQUIRE(located.skipped.size() == 2);
    REQUIRE(located.skipped[0].reason.find("/Width") != std::string::npos);
}

TEST_CASE("Parse color space declarations") {
    SECTION("Names and abbreviations") {
        REQUIRE(parse_color_space(QPDFObjectHandle::newName("/DeviceRGB")).family == ColorFamily::RGB);
        REQUIRE(parse_color_space(QPDFObjectHandle::newName("/G")).family == ColorFamily::Gray);
        REQUIRE(parse_color_space(QPDFObjectHandle::newName("/Pattern")).family == ColorFamily::Other);
        REQUIRE(parse_color_space(QPDFObjectHandle::newNull()).family == ColorFamily::Unspecified);
    }

    SECTION("Calibrated spaces") {
        const auto cal = parse_color_space(QPDFObjectHandle::parse("[/CalRGB << /WhitePoint [0.95 1 1.09] >>]"));
        REQUIRE(cal.family == ColorFamily::RGB);
        REQUIRE(cal.calibrated);
    }

    SECTION("ICC profiles take their family from /N") {
        QPDF pdf;
        pdf.emptyPDF();
        QPDFObjectHandle profile = QPDFObjectHandle::newStream(&pdf, "profile");
        profile.getDict().replaceKey("/N", QPDFObjectHandle::newInteger(4));
        QPDFObjectHandle cs = QPDFObjectHandle::newArray();
        cs.appendItem(QPDFObjectHandle::newName("/ICCBased"));
        cs.appendItem(profile);
        const auto decl = parse_color_space(cs);
        REQUIRE(decl.family == ColorFamily::CMYK);
        REQUIRE(decl.components == 4);
        REQUIRE(decl.calibrated);
    }

    SECTION("Indexed with a string lookup") {
        const auto decl = parse_color_space(QPDFObjectHandle::parse("[/Indexed /DeviceRGB 1 <FF000000FF00>]"));
        REQUIRE(decl.family == ColorFamily::Indexed);
        REQUIRE(decl.base_family == ColorFamily::RGB);
        REQUIRE(decl.hival == 1);
        REQUIRE(decl.lookup == std::vector<unsigned char>{0xFF, 0, 0, 0, 0xFF, 0});
    }

    SECTION("Malformed declarations throw") {
        REQUIRE_THROWS(parse_color_space(QPDFObjectHandle::parse("[/Indexed /DeviceRGB]")));
        REQUIRE_THROWS(parse_color_space(QPDFObjectHandle::newInteger(3)));
    }
}
