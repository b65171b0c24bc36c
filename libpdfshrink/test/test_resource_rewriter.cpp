#include <catch2/catch.hpp>

#include "../include/image_locator.hpp"
#include "../include/resource_rewriter.hpp"
#include "test_pdf_builder.hpp"
#include <mutex>
#include <qpdf/Buffer.hh>

using namespace pdfshrink;
using pdfshrink::test::TestPdfBuilder;

namespace {
EncodedReplacement replacement(const OutputColorSpace cs, const int width, const int height) {
    EncodedReplacement r;
    r.data = {0xFF, 0xD8, 0xFF, 0xD9};
    r.color_space = cs;
    r.width = width;
    r.height = height;
    r.quality = 30;
    return r;
}
} // namespace

TEST_CASE("Rewrite image dictionaries") {
    TestPdfBuilder builder;
    QPDFObjectHandle image = builder.add_image(
        "/Width 4 /Height 4 /ColorSpace [/Indexed /DeviceRGB 1 <FF000000FF00>] /BitsPerComponent 8 "
        "/Decode [0 1] /Interpolate true",
        test::deflate_bytes(std::vector<unsigned char>(16, 1)), "/FlateDecode");
    image.getDict().replaceKey("/DecodeParms", QPDFObjectHandle::parse("<< /Columns 4 >>"));
    builder.add_page({image});

    std::mutex document_mutex;
    auto located = ImageLocator(builder.pdf(), document_mutex).collect();
    REQUIRE(located.images.size() == 1);
    const ImageResource& resource = located.images[0];

    const ResourceRewriter rewriter(document_mutex);
    IndexedModel source;
    rewriter.apply(resource, replacement(OutputColorSpace::DeviceRGB, 2, 2), source);

    QPDFObjectHandle dict = image.getDict();
    REQUIRE(dict.getKey("/Filter").isNameAndEquals("/DCTDecode"));
    REQUIRE_FALSE(dict.hasKey("/DecodeParms"));
    REQUIRE(dict.getKey("/ColorSpace").isNameAndEquals("/DeviceRGB"));
    REQUIRE(dict.getKey("/Width").getIntValue() == 2);
    REQUIRE(dict.getKey("/Height").getIntValue() == 2);
    REQUIRE(dict.getKey("/BitsPerComponent").getIntValue() == 8);
    // /Decode described palette indices
    REQUIRE_FALSE(dict.hasKey("/Decode"));
    // unrelated keys survive
    REQUIRE(dict.getKey("/Interpolate").isBool());
    REQUIRE(image.getRawStreamData()->getSize() == 4);
}

TEST_CASE("Calibrated spaces survive when the component count is unchanged") {
    TestPdfBuilder builder;
    QPDFObjectHandle image = builder.add_image(
        "/Width 2 /Height 2 /ColorSpace [/CalGray << /WhitePoint [0.95 1 1.09] >>] /BitsPerComponent 8 "
        "/Decode [1 0]",
        test::deflate_bytes({1, 2, 3, 4}), "/FlateDecode");
    builder.add_page({image});

    std::mutex document_mutex;
    auto located = ImageLocator(builder.pdf(), document_mutex).collect();
    REQUIRE(located.images.size() == 1);

    ResourceRewriter(document_mutex).apply(located.images[0], replacement(OutputColorSpace::DeviceGray, 2, 2),
                                           GrayModel{});
    QPDFObjectHandle dict = image.getDict();
    REQUIRE(dict.getKey("/ColorSpace").isArray());
    REQUIRE(dict.hasKey("/Decode"));
}
