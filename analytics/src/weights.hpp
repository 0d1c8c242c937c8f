#pragma once

#include "types.hpp"
#include <array>
#include <map>
#include <string>

// Regime -> component weight vector. Built once at startup and read-only
// afterwards, so lookups need no locking.
class WeightTable {
public:
    static constexpr double kSumEpsilon = 1e-6;

    // Built-in defaults for every regime
    WeightTable();

    // Raw confluence.regime_weights from configuration. Regimes missing from
    // the map keep their defaults. Throws ConfigError on unknown regime or
    // component keys, weights outside [0, 1], or vectors not summing to 1.
    explicit WeightTable(const std::map<std::string, std::map<std::string, double>>& raw);

    const WeightVector& weights_for(RegimeLabel regime) const;

    static WeightVector default_weights(RegimeLabel regime);

private:
    static std::size_t slot(RegimeLabel regime) { return static_cast<std::size_t>(regime); }

    std::array<WeightVector, 3> table_;
};
