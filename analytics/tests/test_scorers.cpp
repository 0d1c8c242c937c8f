#include "scorers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {

FeatureSet trend_features(double alignment, double persistence, double distance, double slope) {
    return FeatureSet{
        {"ma_alignment", alignment},
        {"trend_persistence", persistence},
        {"distance_from_ma_pct", distance},
        {"ma_slope_pct", slope}
    };
}

FeatureSet rs_features(double r20, double r60, double r120) {
    return FeatureSet{{"rs_ret_20_pct", r20}, {"rs_ret_60_pct", r60}, {"rs_ret_120_pct", r120}};
}

FeatureSet positioning_features(double funding, double oi_change) {
    return FeatureSet{{"positioning_funding_rate", funding}, {"positioning_oi_change_pct", oi_change}};
}

} // namespace

TEST(ComponentScorers, ScoresStayWithinBoundsOnExtremeInputs) {
    auto scorers = make_default_scorers();

    std::array<FeatureSet, kComponentCount> extreme = {
        trend_features(5.0, 3.0, -400.0, 1e9),
        FeatureSet{{"volume_rvol_20_1", 1e6}, {"volume_trend_slope_pct_20_10", -1e6}, {"volume_percentile_60", 7.0}},
        FeatureSet{{"volatility_atr_pct_14", -3.0}, {"volatility_bb_width_pct_20", 1e9},
                   {"volatility_contraction_ratio_60_20", -1.0}},
        FeatureSet{{"rs_ret_20_pct", 1e9}, {"rs_ret_60_pct", -1e9}, {"rs_ret_120_pct", 0.0}, {"rs_zscore", 99.0}},
        positioning_features(1.0, 1e9)
    };

    for (auto c : kAllComponents) {
        const auto& scorer = scorers[index_of(c)];
        EXPECT_EQ(scorer->component(), c);
        auto score = scorer->score(extreme[index_of(c)]);
        EXPECT_TRUE(score.available) << to_string(c);
        EXPECT_GE(score.value, 0.0) << to_string(c);
        EXPECT_LE(score.value, 100.0) << to_string(c);
    }
}

TEST(ComponentScorers, EmptyFeatureSetIsUnavailableAndNeutral) {
    auto scorers = make_default_scorers();
    for (auto c : kAllComponents) {
        auto score = scorers[index_of(c)]->score(FeatureSet{});
        EXPECT_FALSE(score.available) << to_string(c);
        EXPECT_DOUBLE_EQ(score.value, 50.0) << to_string(c);
    }
}

TEST(ComponentScorers, NonFiniteRequiredFeatureIsUnavailable) {
    TrendScorer scorer;
    auto features = trend_features(1.0, 0.8, 2.0, 1.0);
    features.set("ma_slope_pct", std::numeric_limits<double>::quiet_NaN());

    auto score = scorer.score(features);
    EXPECT_FALSE(score.available);
    EXPECT_DOUBLE_EQ(score.value, 50.0);

    features.set("ma_slope_pct", std::numeric_limits<double>::infinity());
    EXPECT_FALSE(scorer.score(features).available);
}

TEST(ComponentScorers, AvailabilityFlagOfZeroDisablesTheComponent) {
    VolumeScorer scorer;
    FeatureSet features{
        {"volume_rvol_20_1", 2.0},
        {"volume_trend_slope_pct_20_10", 5.0},
        {"volume_percentile_60", 0.9},
        {"has_volume_data", 0.0}
    };
    EXPECT_FALSE(scorer.score(features).available);

    features.set("has_volume_data", 1.0);
    EXPECT_TRUE(scorer.score(features).available);
}

TEST(ComponentScorers, ScoringIsDeterministic) {
    RelativeStrengthScorer scorer;
    auto features = rs_features(12.0, 30.0, 55.0);
    auto a = scorer.score(features);
    auto b = scorer.score(features);
    EXPECT_DOUBLE_EQ(a.value, b.value);
    EXPECT_EQ(a.details, b.details);
}

TEST(TrendScorer, MonotonicInAlignmentAndPersistence) {
    TrendScorer scorer;
    double previous = -1.0;
    for (double alignment : {-1.0, 0.0, 1.0}) {
        double value = scorer.score(trend_features(alignment, 0.5, 1.0, 0.5)).value;
        EXPECT_GT(value, previous);
        previous = value;
    }

    previous = -1.0;
    for (double persistence : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        double value = scorer.score(trend_features(1.0, persistence, 1.0, 0.5)).value;
        EXPECT_GT(value, previous);
        previous = value;
    }
}

TEST(TrendScorer, OverExtensionIsPenalized) {
    EXPECT_DOUBLE_EQ(TrendScorer::extension_score(3.0), 100.0);
    EXPECT_DOUBLE_EQ(TrendScorer::extension_score(-5.0), 100.0);
    EXPECT_DOUBLE_EQ(TrendScorer::extension_score(10.0), 75.0);
    EXPECT_DOUBLE_EQ(TrendScorer::extension_score(40.0), 0.0);
}

TEST(VolumeScorer, RelativeVolumeSweetSpot) {
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(0.0), 0.0);
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(0.5), 30.0);
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(1.5), 80.0);
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(3.0), 100.0);
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(5.0), 85.0);
    EXPECT_DOUBLE_EQ(VolumeScorer::rvol_score(50.0), 70.0);
}

TEST(VolatilityScorer, TighterRangesScoreHigher) {
    VolatilityScorer scorer;
    auto tight = scorer.score(FeatureSet{{"volatility_atr_pct_14", 1.0},
                                         {"volatility_bb_width_pct_20", 3.0},
                                         {"volatility_contraction_ratio_60_20", 0.5}});
    auto wide = scorer.score(FeatureSet{{"volatility_atr_pct_14", 12.0},
                                        {"volatility_bb_width_pct_20", 30.0},
                                        {"volatility_contraction_ratio_60_20", 1.6}});
    ASSERT_TRUE(tight.available);
    ASSERT_TRUE(wide.available);
    EXPECT_GT(tight.value, wide.value);
    EXPECT_LE(wide.value, 40.0);
}

TEST(RelativeStrengthScorer, MonotonicInReturns) {
    RelativeStrengthScorer scorer;
    double previous = -1.0;
    for (double ret : {-60.0, -20.0, 0.0, 20.0, 80.0, 200.0}) {
        double value = scorer.score(rs_features(ret, ret, ret)).value;
        EXPECT_GE(value, previous);
        previous = value;
    }
    EXPECT_DOUBLE_EQ(scorer.score(rs_features(-60.0, -60.0, -60.0)).value, 0.0);
    EXPECT_DOUBLE_EQ(scorer.score(rs_features(200.0, 200.0, 200.0)).value, 100.0);
}

TEST(RelativeStrengthScorer, ZScoreBlendsInWhenPresent) {
    RelativeStrengthScorer scorer;
    auto features = rs_features(0.0, 0.0, 0.0);  // 25 on every window
    EXPECT_DOUBLE_EQ(scorer.score(features).value, 25.0);

    features.set("rs_zscore", 3.0);
    EXPECT_DOUBLE_EQ(scorer.score(features).value, 62.5);
}

TEST(PositioningScorer, CrowdedLongsScoreBelowNeutral) {
    PositioningScorer scorer;
    auto score = scorer.score(positioning_features(0.0005, 40.0));
    ASSERT_TRUE(score.available);
    EXPECT_LT(score.value, 50.0);
}

TEST(PositioningScorer, CrowdedShortsScoreAboveNeutral) {
    PositioningScorer scorer;
    auto score = scorer.score(positioning_features(-0.0005, 40.0));
    ASSERT_TRUE(score.available);
    EXPECT_GT(score.value, 50.0);
}

TEST(PositioningScorer, ExtremeFundingClampsToTheBounds) {
    PositioningScorer scorer;

    auto longs = scorer.score(positioning_features(0.05, 50.0));
    ASSERT_TRUE(longs.available);
    EXPECT_NEAR(longs.value, 14.5, 1e-9);
    EXPECT_LT(longs.value, 50.0);

    auto shorts = scorer.score(positioning_features(-0.05, 50.0));
    ASSERT_TRUE(shorts.available);
    EXPECT_NEAR(shorts.value, 85.5, 1e-9);
    EXPECT_GT(shorts.value, 50.0);
}

TEST(PositioningScorer, FlatFundingIsNeutral) {
    PositioningScorer scorer;
    EXPECT_DOUBLE_EQ(scorer.score(positioning_features(0.0, 80.0)).value, 50.0);
}

TEST(PositioningScorer, UnwindingOpenInterestDoesNotAmplify) {
    EXPECT_DOUBLE_EQ(PositioningScorer::crowding_score(0.002, -30.0), 50.0);
    EXPECT_LT(PositioningScorer::crowding_score(0.002, 30.0), 50.0);
    EXPECT_DOUBLE_EQ(PositioningScorer::funding_score(0.01), 10.0);
    EXPECT_DOUBLE_EQ(PositioningScorer::funding_score(-0.01), 90.0);
}
