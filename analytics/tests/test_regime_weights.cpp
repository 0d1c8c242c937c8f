#include "config.hpp"
#include "regime.hpp"
#include "weights.hpp"
#include <gtest/gtest.h>

namespace {

MarketHealth risk_on(double value) {
    MarketHealth health;
    health.risk_on = value;
    return health;
}

double sum(const WeightVector& weights) {
    double total = 0.0;
    for (double w : weights) {
        total += w;
    }
    return total;
}

} // namespace

TEST(RegimeClassifier, FixedBandsOnRiskOnIndex) {
    RegimeClassifier classifier(RegimeThresholds{});

    EXPECT_EQ(classifier.classify(risk_on(80.0)).label, RegimeLabel::Bull);
    EXPECT_EQ(classifier.classify(risk_on(65.0)).label, RegimeLabel::Bull);
    EXPECT_EQ(classifier.classify(risk_on(50.0)).label, RegimeLabel::Sideways);
    EXPECT_EQ(classifier.classify(risk_on(35.0)).label, RegimeLabel::Bear);
    EXPECT_EQ(classifier.classify(risk_on(10.0)).label, RegimeLabel::Bear);
}

TEST(RegimeClassifier, ConfidenceGrowsAwayFromBoundaries) {
    RegimeClassifier classifier(RegimeThresholds{});

    EXPECT_DOUBLE_EQ(classifier.classify(risk_on(65.0)).confidence, 0.0);
    EXPECT_DOUBLE_EQ(classifier.classify(risk_on(100.0)).confidence, 1.0);
    EXPECT_DOUBLE_EQ(classifier.classify(risk_on(50.0)).confidence, 1.0);
    EXPECT_DOUBLE_EQ(classifier.classify(risk_on(0.0)).confidence, 1.0);
    EXPECT_NEAR(classifier.classify(risk_on(80.0)).confidence, 15.0 / 35.0, 1e-12);
    EXPECT_NEAR(classifier.classify(risk_on(40.0)).confidence, 5.0 / 15.0, 1e-12);

    for (double x = 0.0; x <= 100.0; x += 2.5) {
        auto regime = classifier.classify(risk_on(x));
        EXPECT_GE(regime.confidence, 0.0);
        EXPECT_LE(regime.confidence, 1.0);
    }
}

TEST(RegimeClassifier, CompositeIndexFromPartialInputs) {
    MarketHealth health;
    health.btc_trend = 90.0;
    health.breadth = 80.0;

    auto index = RegimeClassifier::composite_index(health);
    ASSERT_TRUE(index.has_value());
    EXPECT_NEAR(*index, 60.0 / 0.7, 1e-9);

    RegimeClassifier classifier(RegimeThresholds{});
    EXPECT_EQ(classifier.classify(health).label, RegimeLabel::Bull);
}

TEST(RegimeClassifier, NoInputsDefaultsToSidewaysWithoutConfidence) {
    RegimeClassifier classifier(RegimeThresholds{});
    auto regime = classifier.classify(MarketHealth{});
    EXPECT_EQ(regime.label, RegimeLabel::Sideways);
    EXPECT_DOUBLE_EQ(regime.confidence, 0.0);
}

TEST(RegimeClassifier, CustomBands) {
    RegimeThresholds thresholds;
    thresholds.bull_min_risk_on = 55.0;
    thresholds.bear_max_risk_on = 45.0;
    RegimeClassifier classifier(thresholds);

    EXPECT_EQ(classifier.classify(risk_on(56.0)).label, RegimeLabel::Bull);
    EXPECT_EQ(classifier.classify(risk_on(50.0)).label, RegimeLabel::Sideways);
    EXPECT_EQ(classifier.classify(risk_on(44.0)).label, RegimeLabel::Bear);
}

TEST(WeightTable, DefaultVectorsSumToOne) {
    WeightTable table;
    for (auto regime : {RegimeLabel::Bull, RegimeLabel::Sideways, RegimeLabel::Bear}) {
        EXPECT_NEAR(sum(table.weights_for(regime)), 1.0, WeightTable::kSumEpsilon);
        for (double w : table.weights_for(regime)) {
            EXPECT_GE(w, 0.0);
            EXPECT_LE(w, 1.0);
        }
    }
}

TEST(WeightTable, BullFavoursTrendAndBearFavoursPositioning) {
    WeightTable table;
    const auto& bull = table.weights_for(RegimeLabel::Bull);
    const auto& bear = table.weights_for(RegimeLabel::Bear);
    EXPECT_GT(bull[index_of(Component::Trend)], bear[index_of(Component::Trend)]);
    EXPECT_GT(bear[index_of(Component::Positioning)], bull[index_of(Component::Positioning)]);
}

TEST(WeightTable, ConfiguredVectorReplacesDefaultForItsRegime) {
    std::map<std::string, std::map<std::string, double>> raw = {
        {"bull", {{"trend_score", 0.4}, {"volume", 0.2}, {"volatility", 0.1}, {"rs", 0.2}, {"positioning", 0.1}}}
    };
    WeightTable table(raw);

    EXPECT_DOUBLE_EQ(table.weights_for(RegimeLabel::Bull)[index_of(Component::Trend)], 0.4);
    EXPECT_EQ(table.weights_for(RegimeLabel::Bear), WeightTable::default_weights(RegimeLabel::Bear));
}

TEST(WeightTable, MissingComponentsCountAsZeroWeight) {
    std::map<std::string, std::map<std::string, double>> raw = {
        {"sideways", {{"trend", 0.5}, {"volume", 0.5}}}
    };
    WeightTable table(raw);
    const auto& w = table.weights_for(RegimeLabel::Sideways);
    EXPECT_DOUBLE_EQ(w[index_of(Component::Volatility)], 0.0);
    EXPECT_NEAR(sum(w), 1.0, WeightTable::kSumEpsilon);
}

TEST(WeightTable, RejectsVectorsThatDoNotSumToOne) {
    using Raw = std::map<std::string, std::map<std::string, double>>;
    EXPECT_THROW(WeightTable(Raw{{"bull", {{"trend", 0.5}, {"volume", 0.4}}}}), ConfigError);
    EXPECT_THROW(WeightTable(Raw{{"bear", {{"trend", 0.6}, {"volume", 0.6}}}}), ConfigError);
}

TEST(WeightTable, RejectsUnknownKeysAndOutOfRangeWeights) {
    using Raw = std::map<std::string, std::map<std::string, double>>;
    EXPECT_THROW(WeightTable(Raw{{"euphoria", {{"trend", 1.0}}}}), ConfigError);
    EXPECT_THROW(WeightTable(Raw{{"bull", {{"momentum", 1.0}}}}), ConfigError);
    EXPECT_THROW(WeightTable(Raw{{"bull", {{"trend", 1.5}, {"volume", -0.5}}}}), ConfigError);
    EXPECT_THROW(WeightTable(Raw{{"bull", {{"trend", 0.5}, {"trend_score", 0.5}}}}), ConfigError);
}
