//
// Color-preserving image decoder.
//

/**
 * @file image_decoder.hpp
 * @brief IDecodeStrategy interface, its implementations and the decoder chain.
 */

#ifndef PDFSHRINK_IMAGE_DECODER_HPP
#define PDFSHRINK_IMAGE_DECODER_HPP

#include "color_model.hpp"
#include "compression_policy.hpp"
#include "format_sniffer.hpp"
#include "image_resource.hpp"
#include "raster.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace pdfshrink {

/**
 * @brief One way of turning an image resource into a DecodedRaster.
 *
 * Strategies are stateless and may be used from several worker threads
 * at once. A strategy that cannot produce a raster whose length matches
 * the declared geometry returns std::nullopt so the next one is tried.
 */
class IDecodeStrategy {
public:
    virtual ~IDecodeStrategy() = default;

    /// @return Human-readable name (e.g. "direct").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    [[nodiscard]] virtual DecodeStrategyKind kind() const noexcept = 0;

    /// @return true if the strategy can attempt this resource at all.
    [[nodiscard]] virtual bool applies_to(const ImageResource& resource,
                                          ImageEncoding encoding) const noexcept = 0;

    /**
     * @brief Attempts the decode.
     * @param resource Image to decode.
     * @param model Resolved color model, or std::nullopt when the
     * declaration alone does not determine it.
     */
    [[nodiscard]] virtual std::optional<DecodedRaster> decode(const ImageResource& resource,
                                                              const std::optional<ColorModel>& model) const = 0;
};

/**
 * @brief Single Flate filter without predictor, or no filter: inflated locally with zlib.
 */
class DirectRasterStrategy final : public IDecodeStrategy {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "direct"; }
    [[nodiscard]] DecodeStrategyKind kind() const noexcept override { return DecodeStrategyKind::Direct; }
    [[nodiscard]] bool applies_to(const ImageResource& resource, ImageEncoding encoding) const noexcept override;
    [[nodiscard]] std::optional<DecodedRaster> decode(const ImageResource& resource,
                                                      const std::optional<ColorModel>& model) const override;
};

/**
 * @brief DCT-only chain decoded with libjpeg.
 *
 * The stream's component count must agree with the declared color space;
 * without a declaration the model is inferred from the component count.
 */
class EmbeddedJpegStrategy final : public IDecodeStrategy {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "jpeg"; }
    [[nodiscard]] DecodeStrategyKind kind() const noexcept override { return DecodeStrategyKind::EmbeddedJpeg; }
    [[nodiscard]] bool applies_to(const ImageResource& resource, ImageEncoding encoding) const noexcept override;
    [[nodiscard]] std::optional<DecodedRaster> decode(const ImageResource& resource,
                                                      const std::optional<ColorModel>& model) const override;
};

/**
 * @brief Every filter decoded by the PDF library, samples reinterpreted locally.
 */
class GenericExtractionStrategy final : public IDecodeStrategy {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "generic"; }
    [[nodiscard]] DecodeStrategyKind kind() const noexcept override { return DecodeStrategyKind::Generic; }
    [[nodiscard]] bool applies_to(const ImageResource& resource, ImageEncoding encoding) const noexcept override;
    [[nodiscard]] std::optional<DecodedRaster> decode(const ImageResource& resource,
                                                      const std::optional<ColorModel>& model) const override;
};

struct DecodeResult {
    DecodedRaster raster;
    DecodeStrategyKind strategy;
};

/**
 * @brief Chain of responsibility over the decode strategies.
 */
class ColorPreservingDecoder {
public:
    explicit ColorPreservingDecoder(const std::vector<DecodeStrategyKind>& order);

    /**
     * @brief Decodes an image with the first strategy that succeeds.
     * @throws DecodeError if the color space is unsupported or every strategy failed.
     */
    [[nodiscard]] DecodeResult decode(const ImageResource& resource, ImageEncoding encoding) const;

    [[nodiscard]] static std::unique_ptr<IDecodeStrategy> make_strategy(DecodeStrategyKind kind);

private:
    std::vector<std::unique_ptr<IDecodeStrategy>> strategies_;
};

/**
 * @brief Reinterprets fully decoded sample bytes using the declared geometry.
 *
 * Validates the packed length, unpacks sub-byte depths and expands
 * palettes.
 *
 * @return std::nullopt on length mismatch, unsupported depth or missing model.
 */
[[nodiscard]] std::optional<DecodedRaster> raster_from_samples(std::span<const unsigned char> samples,
                                                               const ImageResource& resource,
                                                               const std::optional<ColorModel>& model);

} // namespace pdfshrink

#endif // PDFSHRINK_IMAGE_DECODER_HPP
