//
// Image XObject traversal.
//

#include "../../include/image_locator.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <set>
#include <stdexcept>

namespace {

using pdfshrink::ColorFamily;
using pdfshrink::ColorSpaceDecl;

std::vector<unsigned char> buffer_bytes(const std::shared_ptr<Buffer>& buf) {
    if (!buf || buf->getSize() == 0) return {};
    return {buf->getBuffer(), buf->getBuffer() + buf->getSize()};
}

// device and calibrated families that can serve as an Indexed base
ColorSpaceDecl parse_base_space(QPDFObjectHandle cs) {
    ColorSpaceDecl decl;

    if (cs.isName()) {
        decl.name = cs.getName();
        if (decl.name == "/DeviceGray" || decl.name == "/G") {
            decl.family = ColorFamily::Gray;
            decl.components = 1;
        } else if (decl.name == "/DeviceRGB" || decl.name == "/RGB") {
            decl.family = ColorFamily::RGB;
            decl.components = 3;
        } else if (decl.name == "/DeviceCMYK" || decl.name == "/CMYK") {
            decl.family = ColorFamily::CMYK;
            decl.components = 4;
        } else {
            decl.family = ColorFamily::Other;
        }
        return decl;
    }

    if (!cs.isArray() || cs.getArrayNItems() < 1 || !cs.getArrayItem(0).isName()) {
        throw std::runtime_error("color space is neither a name nor a family array");
    }

    auto items = cs.getArrayAsVector();
    decl.name = items[0].getName();

    if (decl.name == "/CalGray") {
        decl.family = ColorFamily::Gray;
        decl.components = 1;
        decl.calibrated = true;
    } else if (decl.name == "/CalRGB") {
        decl.family = ColorFamily::RGB;
        decl.components = 3;
        decl.calibrated = true;
    } else if (decl.name == "/ICCBased") {
        if (items.size() < 2 || !items[1].isStream()) {
            throw std::runtime_error("ICCBased without a profile stream");
        }
        QPDFObjectHandle n = items[1].getDict().getKey("/N");
        if (!n.isInteger()) {
            throw std::runtime_error("ICCBased profile without /N");
        }
        decl.components = n.getIntValueAsInt();
        decl.calibrated = true;
        switch (decl.components) {
            case 1: decl.family = ColorFamily::Gray; break;
            case 3: decl.family = ColorFamily::RGB; break;
            case 4: decl.family = ColorFamily::CMYK; break;
            default:
                throw std::runtime_error("ICCBased /N " + std::to_string(decl.components));
        }
    } else if (items.size() == 1) {
        // [/DeviceRGB] and friends
        return parse_base_space(items[0]);
    } else {
        decl.family = ColorFamily::Other;
    }
    return decl;
}

// /Filter as a list in decode order
std::vector<std::string> parse_filters(QPDFObjectHandle filter) {
    std::vector<std::string> filters;
    if (filter.isNull()) {
        return filters;
    }
    if (filter.isName()) {
        filters.push_back(filter.getName());
        return filters;
    }
    if (!filter.isArray()) {
        throw std::runtime_error("/Filter is neither a name nor an array");
    }
    for (auto& item : filter.getArrayAsVector()) {
        if (!item.isName()) {
            throw std::runtime_error("/Filter array holds a non-name");
        }
        filters.push_back(item.getName());
    }
    return filters;
}

int parse_predictor(QPDFObjectHandle parms) {
    if (parms.isArray()) {
        if (parms.getArrayNItems() < 1) return 1;
        parms = parms.getArrayItem(0);
    }
    if (parms.isDictionary()) {
        QPDFObjectHandle predictor = parms.getKey("/Predictor");
        if (predictor.isInteger()) {
            return predictor.getIntValueAsInt();
        }
    }
    return 1;
}

std::vector<double> parse_decode(QPDFObjectHandle decode) {
    std::vector<double> ranges;
    if (decode.isNull()) {
        return ranges;
    }
    if (!decode.isArray()) {
        throw std::runtime_error("/Decode is not an array");
    }
    for (auto& item : decode.getArrayAsVector()) {
        if (!item.isNumber()) {
            throw std::runtime_error("/Decode array holds a non-number");
        }
        ranges.push_back(item.getNumericValue());
    }
    return ranges;
}

int positive_dimension(QPDFObjectHandle dict, const char* key) {
    QPDFObjectHandle value = dict.getKey(key);
    if (!value.isInteger()) {
        throw std::runtime_error(std::string("missing ") + key);
    }
    const long long v = value.getIntValue();
    if (v <= 0 || v > 0x7FFFFFFF) {
        throw std::runtime_error(std::string("invalid ") + key + " " + std::to_string(v));
    }
    return static_cast<int>(v);
}

} // namespace

namespace pdfshrink {

ColorSpaceDecl parse_color_space(QPDFObjectHandle color_space) {
    if (color_space.isNull()) {
        return {};
    }

    if (color_space.isArray() && color_space.getArrayNItems() >= 1 &&
        color_space.getArrayItem(0).isNameAndEquals("/Indexed")) {
        auto items = color_space.getArrayAsVector();
        if (items.size() != 4) {
            throw std::runtime_error("Indexed color space needs 4 entries");
        }
        const ColorSpaceDecl base = parse_base_space(items[1]);
        if (!items[2].isInteger()) {
            throw std::runtime_error("Indexed hival is not an integer");
        }

        ColorSpaceDecl decl;
        decl.family = ColorFamily::Indexed;
        decl.name = "/Indexed";
        decl.components = 1;
        decl.base_family = base.family;
        decl.base_components = base.components;
        decl.hival = items[2].getIntValueAsInt();

        QPDFObjectHandle lookup = items[3];
        if (lookup.isString()) {
            const std::string bytes = lookup.getStringValue();
            decl.lookup.assign(bytes.begin(), bytes.end());
        } else if (lookup.isStream()) {
            decl.lookup = buffer_bytes(lookup.getStreamData(qpdf_dl_generalized));
        } else {
            throw std::runtime_error("Indexed lookup is neither a string nor a stream");
        }
        return decl;
    }

    if (color_space.isArray() && color_space.getArrayNItems() >= 1 &&
        color_space.getArrayItem(0).isNameAndEquals("/I")) {
        throw std::runtime_error("abbreviated /I is not valid outside inline images");
    }

    return parse_base_space(color_space);
}

void ImageLocator::for_each(const ImageVisitor& on_image, const SkipVisitor& on_skip) const {
    std::set<QPDFObjGen> seen;
    int page_number = 0;

    QPDFPageDocumentHelper pages(pdf_);
    for (auto& page : pages.getAllPages()) {
        ++page_number;
        try {
            page.forEachImage(true, [&](QPDFObjectHandle& image, QPDFObjectHandle&, std::string const& key) {
                const QPDFObjGen og = image.getObjGen();
                if (image.isIndirect()) {
                    if (seen.contains(og)) return;
                    seen.insert(og);
                }

                const std::string label = "p" + std::to_string(page_number) + " " + key + " (" +
                                          std::to_string(og.getObj()) + " " + std::to_string(og.getGen()) + " R)";

                QPDFObjectHandle dict = image.getDict();
                if (dict.getKey("/ImageMask").isBool() && dict.getKey("/ImageMask").getBoolValue()) {
                    return;
                }

                ImageResource resource;
                try {
                    resource.object = image;
                    resource.id = og;
                    resource.label = label;
                    resource.page = page_number;
                    resource.width = positive_dimension(dict, "/Width");
                    resource.height = positive_dimension(dict, "/Height");
                    resource.filters = parse_filters(dict.getKey("/Filter"));
                    resource.predictor = parse_predictor(dict.getKey("/DecodeParms"));
                    resource.color_space = parse_color_space(dict.getKey("/ColorSpace"));

                    QPDFObjectHandle bpc = dict.getKey("/BitsPerComponent");
                    if (bpc.isInteger()) {
                        resource.bits_per_component = bpc.getIntValueAsInt();
                    }
                    resource.color_key_masked = dict.getKey("/Mask").isArray();
                    resource.decode = parse_decode(dict.getKey("/Decode"));
                    resource.raw = buffer_bytes(image.getRawStreamData());
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Warning, label + " skipped: " + e.what(), "image_locator");
                    if (on_skip) on_skip(SkippedEntry{label, page_number, e.what()});
                    return;
                }

                resource.fetch_decoded = [object = image, &mutex = document_mutex_]() mutable {
                    std::lock_guard lock(mutex);
                    return buffer_bytes(object.getStreamData(qpdf_dl_all));
                };

                on_image(std::move(resource));
            });
        } catch (const std::exception& e) {
            // broken resources on one page do not stop the traversal
            const std::string label = "p" + std::to_string(page_number);
            Logger::log(LogLevel::Warning, label + " resources unreadable: " + e.what(), "image_locator");
            if (on_skip) on_skip(SkippedEntry{label, page_number, e.what()});
        }
    }
}

LocatedImages ImageLocator::collect() const {
    LocatedImages located;
    for_each(
        [&](ImageResource&& resource) { located.images.push_back(std::move(resource)); },
        [&](const SkippedEntry& entry) { located.skipped.push_back(entry); });

    Logger::log(LogLevel::Debug,
                "Located " + std::to_string(located.images.size()) + " images, skipped " +
                std::to_string(located.skipped.size()),
                "image_locator");
    return located;
}

} // namespace pdfshrink
