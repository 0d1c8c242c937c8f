#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>

// Maps a market-health summary to bull / sideways / bear using fixed bands
// on a composite risk-on index. Stateless: hysteresis belongs to callers.
class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeThresholds& thresholds);

    Regime classify(const MarketHealth& health) const;

    // Supplied risk_on, or a blend of benchmark trend, breadth, volatility
    // comfort and average positioning over whichever inputs are present
    static std::optional<double> composite_index(const MarketHealth& health);

private:
    RegimeThresholds thresholds_;
};
