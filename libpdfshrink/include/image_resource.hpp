//
// One embedded image as seen by the recompression pipeline.
//

/**
 * @file image_resource.hpp
 * @brief Declared metadata and stored bytes of an image XObject.
 */

#ifndef PDFSHRINK_IMAGE_RESOURCE_HPP
#define PDFSHRINK_IMAGE_RESOURCE_HPP

#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pdfshrink {

/**
 * @brief Color space family as declared in an image dictionary.
 */
enum class ColorFamily {
    Unspecified, ///< No /ColorSpace key
    Gray,        ///< DeviceGray, CalGray, ICCBased N=1
    RGB,         ///< DeviceRGB, CalRGB, ICCBased N=3
    CMYK,        ///< DeviceCMYK, ICCBased N=4
    Indexed,     ///< Palette over one of the above
    Other        ///< Lab, Separation, DeviceN, Pattern, unknown names
};

/**
 * @brief Parsed /ColorSpace entry.
 *
 * The Locator fills it on the document thread so that workers never
 * touch qpdf objects to learn about colors.
 */
struct ColorSpaceDecl {
    ColorFamily family = ColorFamily::Unspecified;
    std::string name;       ///< Family name as written, e.g. "/DeviceRGB", "/ICCBased"
    int components = 0;     ///< Components per pixel of the declared space, 0 if unknown
    bool calibrated = false;///< CalGray, CalRGB or ICCBased

    // Indexed only
    ColorFamily base_family = ColorFamily::Unspecified;
    int base_components = 0;
    int hival = 0;
    std::vector<unsigned char> lookup; ///< Palette bytes, base_components per entry
};

/**
 * @brief One image XObject found in the document.
 *
 * Created by ImageLocator for a single pass. Decoder and Recompressor
 * only read it; ResourceRewriter writes through @ref object under the
 * document lock.
 */
struct ImageResource {
    QPDFObjectHandle object;             ///< Backing stream, only touched under the document lock
    QPDFObjGen id;                       ///< Object/generation number
    std::string label;                   ///< e.g. "p3 /Im1 (12 0 R)"
    int page = 0;                        ///< 1-based page of first occurrence

    std::vector<std::string> filters;    ///< /Filter entries in decode order
    int predictor = 1;                   ///< /Predictor of the first filter's /DecodeParms
    ColorSpaceDecl color_space;
    std::optional<int> bits_per_component;
    int width = 0;
    int height = 0;
    bool color_key_masked = false;       ///< /Mask is a color-key array
    std::vector<double> decode;          ///< /Decode array as written, empty when absent

    std::vector<unsigned char> raw;      ///< Stream data as stored in the file

    /// Decodes every filter through the PDF library; serialized on the document lock.
    std::function<std::vector<unsigned char>()> fetch_decoded;

    /// @return The filter chain joined with spaces, "none" when empty.
    [[nodiscard]] std::string filter_string() const {
        if (filters.empty()) return "none";
        std::string out;
        for (const auto& f : filters) {
            if (!out.empty()) out += ' ';
            out += f;
        }
        return out;
    }
};

} // namespace pdfshrink

#endif // PDFSHRINK_IMAGE_RESOURCE_HPP
