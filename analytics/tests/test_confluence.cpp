#include "confluence.hpp"
#include "scoring.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {

using Scores = std::array<ComponentScore, kComponentCount>;

Scores all_available(double trend, double volume, double volatility, double rs, double positioning) {
    return {
        ComponentScore::make(Component::Trend, trend),
        ComponentScore::make(Component::Volume, volume),
        ComponentScore::make(Component::Volatility, volatility),
        ComponentScore::make(Component::RelativeStrength, rs),
        ComponentScore::make(Component::Positioning, positioning)
    };
}

Scores none_available() {
    Scores scores;
    for (auto c : kAllComponents) {
        scores[index_of(c)] = ComponentScore::unavailable(c);
    }
    return scores;
}

Regime bull(double confidence = 1.0) {
    return Regime{RegimeLabel::Bull, confidence, 90.0};
}

} // namespace

class ConfluenceAggregatorTest : public ::testing::Test {
protected:
    WeightTable weights_;
    ConfluenceAggregator aggregator_{weights_};
};

TEST_F(ConfluenceAggregatorTest, WeightedSumWithEveryComponent) {
    auto result = aggregator_.aggregate(all_available(80, 60, 40, 70, 50), bull());
    // 0.30*80 + 0.25*60 + 0.10*40 + 0.25*70 + 0.10*50
    EXPECT_NEAR(result.confluence, 65.5, 1e-9);
    EXPECT_NEAR(result.confidence, 1.0, 1e-9);
    EXPECT_FALSE(result.low_confidence);
}

TEST_F(ConfluenceAggregatorTest, RenormalizesOverAvailableComponents) {
    auto scores = none_available();
    scores[index_of(Component::Trend)] = ComponentScore::make(Component::Trend, 80.0);
    scores[index_of(Component::Volume)] = ComponentScore::make(Component::Volume, 60.0);

    auto result = aggregator_.aggregate(scores, bull());
    EXPECT_NEAR(result.confluence, (0.30 * 80.0 + 0.25 * 60.0) / 0.55, 1e-9);
    EXPECT_NEAR(result.confidence, 0.55, 1e-9);
    EXPECT_FALSE(result.low_confidence);

    double total = 0.0;
    for (double w : result.effective_weights) {
        total += w;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.effective_weights[index_of(Component::Volatility)], 0.0);
}

TEST_F(ConfluenceAggregatorTest, UnavailableComponentValueIsIgnored) {
    auto scores = all_available(80, 60, 40, 70, 50);
    scores[index_of(Component::Positioning)] = ComponentScore::make(Component::Positioning, 100.0, false);

    auto with_bogus = aggregator_.aggregate(scores, bull());
    scores[index_of(Component::Positioning)] = ComponentScore::unavailable(Component::Positioning);
    auto with_neutral = aggregator_.aggregate(scores, bull());

    EXPECT_DOUBLE_EQ(with_bogus.confluence, with_neutral.confluence);
}

TEST_F(ConfluenceAggregatorTest, NoComponentsGivesNeutralScoreWithoutConfidence) {
    auto result = aggregator_.aggregate(none_available(), bull());
    EXPECT_DOUBLE_EQ(result.confluence, 50.0);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_TRUE(result.low_confidence);
}

TEST_F(ConfluenceAggregatorTest, SingleComponentIsFlaggedLowConfidence) {
    auto scores = none_available();
    scores[index_of(Component::RelativeStrength)] = ComponentScore::make(Component::RelativeStrength, 72.0);

    auto result = aggregator_.aggregate(scores, bull());
    EXPECT_NEAR(result.confluence, 72.0, 1e-9);
    EXPECT_TRUE(result.low_confidence);
}

TEST_F(ConfluenceAggregatorTest, ConfidenceScalesWithRegimeConfidence) {
    auto scores = all_available(60, 60, 60, 60, 60);
    EXPECT_NEAR(aggregator_.aggregate(scores, bull(0.5)).confidence, 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(aggregator_.aggregate(scores, bull(0.0)).confidence, 0.0);
}

TEST_F(ConfluenceAggregatorTest, OutputStaysInBounds) {
    EXPECT_DOUBLE_EQ(aggregator_.aggregate(all_available(100, 100, 100, 100, 100), bull()).confluence, 100.0);
    EXPECT_DOUBLE_EQ(aggregator_.aggregate(all_available(0, 0, 0, 0, 0), bull()).confluence, 0.0);
}

TEST_F(ConfluenceAggregatorTest, IdenticalInputsGiveIdenticalOutput) {
    auto scores = all_available(63.2, 48.9, 71.4, 55.0, 38.7);
    Regime regime{RegimeLabel::Sideways, 0.4, 52.0};

    auto first = aggregator_.aggregate(scores, regime);
    auto second = aggregator_.aggregate(scores, regime);
    EXPECT_EQ(first.confluence, second.confluence);
    EXPECT_EQ(first.confidence, second.confidence);
    EXPECT_EQ(first.effective_weights, second.effective_weights);
}

TEST_F(ConfluenceAggregatorTest, RegimeSelectsTheWeightVector) {
    auto scores = all_available(90, 50, 50, 50, 10);
    double in_bull = aggregator_.aggregate(scores, Regime{RegimeLabel::Bull, 1.0, 90.0}).confluence;
    double in_bear = aggregator_.aggregate(scores, Regime{RegimeLabel::Bear, 1.0, 10.0}).confluence;
    EXPECT_GT(in_bull, in_bear);
}

TEST(ScoringEngine, BuildsBundleFromSymbolFeatures) {
    WeightTable weights;
    ScoringEngine engine(weights);

    SymbolInput input;
    input.symbol = "SOLUSDT";
    input.timeframe = "4h";
    input.features[Component::Trend] = FeatureSet{
        {"ma_alignment", 1.0}, {"trend_persistence", 0.9}, {"distance_from_ma_pct", 2.0}, {"ma_slope_pct", 2.5}};
    input.features[Component::Volatility] = FeatureSet{
        {"volatility_atr_pct_14", 2.0}, {"volatility_bb_width_pct_20", 4.5},
        {"volatility_contraction_ratio_60_20", 0.6}};
    input.patterns = {"rsi_bullish_divergence"};
    input.pattern_bars_since = {{"rsi_bullish_divergence", 1}};

    auto bundle = engine.build_bundle(input, bull(), test_helpers::base_time());

    EXPECT_EQ(bundle.symbol, "SOLUSDT");
    EXPECT_EQ(bundle.timeframe, "4h");
    EXPECT_EQ(bundle.available_count(), 2u);
    EXPECT_TRUE(bundle.component(Component::Trend).available);
    EXPECT_FALSE(bundle.component(Component::Volume).available);
    EXPECT_DOUBLE_EQ(bundle.score(Component::Volume), 50.0);
    ASSERT_TRUE(bundle.bb_width_pct.has_value());
    EXPECT_DOUBLE_EQ(*bundle.bb_width_pct, 4.5);
    EXPECT_FALSE(bundle.low_confidence);
    EXPECT_NEAR(bundle.confidence, 0.40, 1e-9);
    EXPECT_EQ(bundle.patterns.count("rsi_bullish_divergence"), 1u);
    EXPECT_EQ(bundle.timestamp, test_helpers::base_time());
}

TEST(ScoringEngine, SymbolWithoutFeaturesIsNeutral) {
    WeightTable weights;
    ScoringEngine engine(weights);

    SymbolInput input;
    input.symbol = "NEWCOIN";
    input.timeframe = "1d";

    auto bundle = engine.build_bundle(input, bull(), test_helpers::base_time());
    EXPECT_DOUBLE_EQ(bundle.confluence, 50.0);
    EXPECT_DOUBLE_EQ(bundle.confidence, 0.0);
    EXPECT_TRUE(bundle.low_confidence);
    EXPECT_FALSE(bundle.bb_width_pct.has_value());
}
