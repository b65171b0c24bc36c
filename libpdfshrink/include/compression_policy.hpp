//
// Per-run recompression settings.
//

/**
 * @file compression_policy.hpp
 * @brief CompressionPolicy, quality tiers and decode strategy ordering.
 */

#ifndef PDFSHRINK_COMPRESSION_POLICY_HPP
#define PDFSHRINK_COMPRESSION_POLICY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdfshrink {

/**
 * @brief What to do with CMYK rasters.
 */
enum class CmykHandling {
    Preserve,    ///< Emit CMYK JPEG streams (libjpeg supports them natively)
    ConvertToRgb ///< Convert to an RGB approximation before encoding
};

/**
 * @brief Identifies a decode strategy of ColorPreservingDecoder.
 */
enum class DecodeStrategyKind {
    Direct,       ///< Inflate or copy raw samples locally
    EmbeddedJpeg, ///< Decode a DCT stream with libjpeg
    Generic       ///< Let qpdf decode every filter
};

/**
 * @brief Named color/gray quality presets.
 */
enum class QualityTier {
    High,     ///< color 60, gray 70
    Balanced, ///< color 45, gray 55
    Compact   ///< color 30, gray 40
};

/**
 * @brief Immutable configuration of one run, shared by all image tasks.
 */
struct CompressionPolicy {
    static constexpr int kDefaultQuality = 30;
    static constexpr int kDefaultMaxDimension = 1200;
    static constexpr double kDefaultMinSavingsPercent = 10.0;

    int quality = kDefaultQuality;              ///< JPEG quality for color images, 1..100
    std::optional<int> grayscale_quality;       ///< Defaults to @ref quality
    std::optional<int> max_width = kDefaultMaxDimension;  ///< std::nullopt: no limit
    std::optional<int> max_height = kDefaultMaxDimension; ///< std::nullopt: no limit
    CmykHandling cmyk_handling = CmykHandling::Preserve;
    std::vector<DecodeStrategyKind> strategy_order{
        DecodeStrategyKind::Direct,
        DecodeStrategyKind::EmbeddedJpeg,
        DecodeStrategyKind::Generic
    };
    double min_savings_percent = kDefaultMinSavingsPercent;

    /**
     * @brief Builds the default policy with a tier's quality pair.
     */
    [[nodiscard]] static CompressionPolicy from_tier(QualityTier tier);

    /// @return Quality used for single-channel rasters.
    [[nodiscard]] int effective_grayscale_quality() const noexcept {
        return grayscale_quality.value_or(quality);
    }

    /**
     * @brief Checks every invariant of the policy.
     * @throws std::invalid_argument naming the offending field.
     */
    void validate() const;
};

/// @return The tier named "high", "balanced" or "compact" (case-insensitive).
[[nodiscard]] std::optional<QualityTier> parse_quality_tier(std::string_view name);

/**
 * @brief Parses a comma separated strategy list such as "direct,jpeg,generic".
 * @return std::nullopt on unknown or repeated names, or an empty list.
 */
[[nodiscard]] std::optional<std::vector<DecodeStrategyKind>> parse_strategy_order(std::string_view list);

[[nodiscard]] std::string_view to_string(DecodeStrategyKind kind) noexcept;

} // namespace pdfshrink

#endif // PDFSHRINK_COMPRESSION_POLICY_HPP
