#include <catch2/catch.hpp>

#include "../include/compression_policy.hpp"
#include <stdexcept>

using namespace pdfshrink;

TEST_CASE("Policy defaults and tiers") {
    const CompressionPolicy policy;
    REQUIRE(policy.quality == 30);
    REQUIRE(policy.effective_grayscale_quality() == 30);
    REQUIRE(policy.max_width == 1200);
    REQUIRE(policy.max_height == 1200);
    REQUIRE(policy.cmyk_handling == CmykHandling::Preserve);
    REQUIRE(policy.strategy_order.size() == 3);
    REQUIRE_NOTHROW(policy.validate());

    const auto high = CompressionPolicy::from_tier(QualityTier::High);
    REQUIRE(high.quality == 60);
    REQUIRE(high.effective_grayscale_quality() == 70);
    const auto compact = CompressionPolicy::from_tier(QualityTier::Compact);
    REQUIRE(compact.quality == 30);
    REQUIRE(compact.effective_grayscale_quality() == 40);
}

TEST_CASE("Policy validation") {
    CompressionPolicy policy;

    SECTION("Quality out of range") {
        policy.quality = 0;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
        policy.quality = 101;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }

    SECTION("Bounds must be positive") {
        policy.max_width = 0;
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }

    SECTION("No limit is valid") {
        policy.max_width.reset();
        policy.max_height.reset();
        REQUIRE_NOTHROW(policy.validate());
    }

    SECTION("Strategy order must be non-empty and distinct") {
        policy.strategy_order.clear();
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
        policy.strategy_order = {DecodeStrategyKind::Direct, DecodeStrategyKind::Direct};
        REQUIRE_THROWS_AS(policy.validate(), std::invalid_argument);
    }
}

TEST_CASE("Parse tiers and strategy lists") {
    REQUIRE(parse_quality_tier("Balanced") == QualityTier::Balanced);
    REQUIRE_FALSE(parse_quality_tier("ultra").has_value());

    const auto order = parse_strategy_order("generic, direct");
    REQUIRE(order.has_value());
    REQUIRE(*order == std::vector<DecodeStrategyKind>{DecodeStrategyKind::Generic, DecodeStrategyKind::Direct});
    REQUIRE(parse_strategy_order("embedded-jpeg")->front() == DecodeStrategyKind::EmbeddedJpeg);
    REQUIRE_FALSE(parse_strategy_order("direct,direct").has_value());
    REQUIRE_FALSE(parse_strategy_order("direct,magic").has_value());
    REQUIRE_FALSE(parse_strategy_order("").has_value());
}
