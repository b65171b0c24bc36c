//
// Image stream replacement.
//

#include "../../include/resource_rewriter.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <string>

namespace pdfshrink {

void ResourceRewriter::apply(const ImageResource& resource,
                             const EncodedReplacement& replacement,
                             const ColorModel& source_model) const {
    const int out_components = components(replacement.color_space);
    const bool was_indexed = std::holds_alternative<IndexedModel>(source_model);
    const bool same_components = !was_indexed && sample_channels(source_model) == out_components;

    std::lock_guard lock(document_mutex_);

    QPDFObjectHandle stream = resource.object;
    QPDFObjectHandle dict = stream.getDict();

    stream.replaceStreamData(
        std::string(reinterpret_cast<const char*>(replacement.data.data()), replacement.data.size()),
        QPDFObjectHandle::newName(replacement.filter),
        QPDFObjectHandle::newNull()
    );

    if (!(same_components && resource.color_space.calibrated)) {
        dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(std::string(pdf_name(replacement.color_space))));
    }
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(replacement.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(replacement.height));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(replacement.bits_per_component));

    if (!same_components && dict.hasKey("/Decode")) {
        dict.removeKey("/Decode");
    }

    if (Logger::enabled(LogLevel::Debug)) {
        Logger::log(LogLevel::Debug,
                    resource.label + ": rewritten as " + std::string(pdf_name(replacement.color_space)) + " " +
                    std::to_string(replacement.width) + "x" + std::to_string(replacement.height) +
                    ", " + std::to_string(replacement.data.size()) + " bytes",
                    "rewriter");
    }
}

} // namespace pdfshrink
