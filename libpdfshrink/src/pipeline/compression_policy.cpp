//
// CompressionPolicy validation and parsing helpers.
//

#include "../../include/compression_policy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

namespace pdfshrink {

CompressionPolicy CompressionPolicy::from_tier(const QualityTier tier) {
    CompressionPolicy policy;
    switch (tier) {
        case QualityTier::High:
            policy.quality = 60;
            policy.grayscale_quality = 70;
            break;
        case QualityTier::Balanced:
            policy.quality = 45;
            policy.grayscale_quality = 55;
            break;
        case QualityTier::Compact:
            policy.quality = 30;
            policy.grayscale_quality = 40;
            break;
    }
    return policy;
}

void CompressionPolicy::validate() const {
    if (quality < 1 || quality > 100) {
        throw std::invalid_argument("quality must be in [1, 100], got " + std::to_string(quality));
    }
    if (grayscale_quality && (*grayscale_quality < 1 || *grayscale_quality > 100)) {
        throw std::invalid_argument("grayscale quality must be in [1, 100], got " +
                                    std::to_string(*grayscale_quality));
    }
    if (max_width && *max_width < 1) {
        throw std::invalid_argument("max width must be at least 1");
    }
    if (max_height && *max_height < 1) {
        throw std::invalid_argument("max height must be at least 1");
    }
    if (min_savings_percent < 0.0 || min_savings_percent >= 100.0) {
        throw std::invalid_argument("minimum savings must be in [0, 100)");
    }
    if (strategy_order.empty()) {
        throw std::invalid_argument("strategy order must name at least one strategy");
    }
    for (size_t i = 0; i < strategy_order.size(); ++i) {
        for (size_t j = i + 1; j < strategy_order.size(); ++j) {
            if (strategy_order[i] == strategy_order[j]) {
                throw std::invalid_argument("strategy order lists " +
                                            std::string(to_string(strategy_order[i])) + " twice");
            }
        }
    }
}

std::optional<QualityTier> parse_quality_tier(const std::string_view name) {
    const std::string n = lowercase(trim(name));
    if (n == "high") return QualityTier::High;
    if (n == "balanced") return QualityTier::Balanced;
    if (n == "compact") return QualityTier::Compact;
    return std::nullopt;
}

std::optional<std::vector<DecodeStrategyKind>> parse_strategy_order(std::string_view list) {
    std::vector<DecodeStrategyKind> order;
    while (true) {
        const size_t comma = list.find(',');
        const std::string token = lowercase(trim(list.substr(0, comma)));

        DecodeStrategyKind kind;
        if (token == "direct") {
            kind = DecodeStrategyKind::Direct;
        } else if (token == "jpeg" || token == "embedded-jpeg") {
            kind = DecodeStrategyKind::EmbeddedJpeg;
        } else if (token == "generic") {
            kind = DecodeStrategyKind::Generic;
        } else {
            return std::nullopt;
        }
        if (std::ranges::find(order, kind) != order.end()) {
            return std::nullopt;
        }
        order.push_back(kind);

        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return order;
}

std::string_view to_string(const DecodeStrategyKind kind) noexcept {
    switch (kind) {
        case DecodeStrategyKind::Direct:       return "direct";
        case DecodeStrategyKind::EmbeddedJpeg: return "jpeg";
        case DecodeStrategyKind::Generic:      return "generic";
    }
    return "unknown";
}

} // namespace pdfshrink
