//
// Lossy re-encoding of decoded rasters.
//

#ifndef PDFSHRINK_RECOMPRESSOR_HPP
#define PDFSHRINK_RECOMPRESSOR_HPP

#include "compression_policy.hpp"
#include "raster.hpp"
#include <utility>

namespace pdfshrink {

/**
 * @brief Re-encodes a DecodedRaster as a JPEG stream under a policy.
 *
 * Depth is reduced to 8 bits, the raster is downscaled into the policy
 * bound if needed, and the result is encoded in the raster's own color
 * model: gray stays gray, CMYK stays CMYK unless the policy asks for RGB.
 */
class Recompressor {
public:
    explicit Recompressor(CompressionPolicy policy) : policy_(std::move(policy)) {}

    /**
     * @brief Produces the replacement stream.
     * @param raster Decoded image, consumed.
     * @throws EncodeError if the raster is inconsistent or libjpeg fails.
     */
    [[nodiscard]] EncodedReplacement recompress(DecodedRaster raster) const;

private:
    CompressionPolicy policy_;
};

} // namespace pdfshrink

#endif // PDFSHRINK_RECOMPRESSOR_HPP
