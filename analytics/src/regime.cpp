#include "regime.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

RegimeClassifier::RegimeClassifier(const RegimeThresholds& thresholds)
    : thresholds_(thresholds) {}

std::optional<double> RegimeClassifier::composite_index(const MarketHealth& health) {
    if (health.risk_on) {
        return clamp_value(*health.risk_on, 0.0, 100.0);
    }

    double weighted = 0.0;
    double total_weight = 0.0;

    auto add = [&](const std::optional<double>& value, double weight) {
        if (value) {
            weighted += weight * clamp_value(*value, 0.0, 100.0);
            total_weight += weight;
        }
    };

    add(health.btc_trend, 0.40);
    add(health.breadth, 0.30);
    if (health.btc_volatility) {
        // Volatility far from neutral in either direction is uncomfortable
        double offset = std::fabs(*health.btc_volatility - 50.0);
        add(100.0 - std::min(100.0, offset * 2.0), 0.15);
    }
    add(health.avg_positioning, 0.15);

    if (total_weight <= 0.0) {
        return std::nullopt;
    }
    return clamp_value(weighted / total_weight, 0.0, 100.0);
}

Regime RegimeClassifier::classify(const MarketHealth& health) const {
    Regime regime;

    auto index = composite_index(health);
    if (!index) {
        spdlog::warn("Market health has no usable inputs; defaulting regime to sideways with zero confidence");
        regime.label = RegimeLabel::Sideways;
        regime.confidence = 0.0;
        regime.index = 50.0;
        return regime;
    }

    const double bull_min = thresholds_.bull_min_risk_on;
    const double bear_max = thresholds_.bear_max_risk_on;
    const double x = *index;
    regime.index = x;

    // Confidence is the distance to the nearest band boundary, normalized by
    // the largest distance possible inside that band
    if (x >= bull_min) {
        regime.label = RegimeLabel::Bull;
        double span = 100.0 - bull_min;
        regime.confidence = span > 0.0 ? (x - bull_min) / span : 1.0;
    } else if (x <= bear_max) {
        regime.label = RegimeLabel::Bear;
        regime.confidence = bear_max > 0.0 ? (bear_max - x) / bear_max : 1.0;
    } else {
        regime.label = RegimeLabel::Sideways;
        double half_width = (bull_min - bear_max) / 2.0;
        double distance = std::min(x - bear_max, bull_min - x);
        regime.confidence = half_width > 0.0 ? distance / half_width : 0.0;
    }

    regime.confidence = clamp_value(regime.confidence, 0.0, 1.0);

    spdlog::debug("Regime {} (index {:.1f}, confidence {:.2f})",
                  to_string(regime.label), regime.index, regime.confidence);
    return regime;
}
