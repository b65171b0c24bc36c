//
// Re-embedding of recompressed images.
//

#ifndef PDFSHRINK_RESOURCE_REWRITER_HPP
#define PDFSHRINK_RESOURCE_REWRITER_HPP

#include "color_model.hpp"
#include "image_resource.hpp"
#include "raster.hpp"
#include <mutex>

namespace pdfshrink {

/**
 * @brief Writes an EncodedReplacement into the image's stream object.
 *
 * Replaces the data and the keys that describe it (/Filter, /DecodeParms,
 * /ColorSpace, /Width, /Height, /BitsPerComponent); every other key is
 * left alone. /Decode is dropped when it no longer matches the samples,
 * and calibrated or ICC color spaces are kept when the component count
 * is unchanged.
 */
class ResourceRewriter {
public:
    explicit ResourceRewriter(std::mutex& document_mutex) : document_mutex_(document_mutex) {}

    /**
     * @brief Applies the replacement under the document lock.
     * @param source_model Color model the image was decoded from.
     * @throws std::exception from qpdf if the object cannot be modified.
     */
    void apply(const ImageResource& resource,
               const EncodedReplacement& replacement,
               const ColorModel& source_model) const;

private:
    std::mutex& document_mutex_;
};

} // namespace pdfshrink

#endif // PDFSHRINK_RESOURCE_REWRITER_HPP
