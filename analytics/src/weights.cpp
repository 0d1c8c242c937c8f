#include "weights.hpp"
#include "config.hpp"
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

WeightVector WeightTable::default_weights(RegimeLabel regime) {
    // trend, volume, volatility, relative strength, positioning
    switch (regime) {
        case RegimeLabel::Bull: return {0.30, 0.25, 0.10, 0.25, 0.10};
        case RegimeLabel::Sideways: return {0.20, 0.20, 0.25, 0.20, 0.15};
        case RegimeLabel::Bear: return {0.15, 0.20, 0.25, 0.15, 0.25};
    }
    return {0.20, 0.20, 0.20, 0.20, 0.20};
}

WeightTable::WeightTable() {
    for (auto regime : {RegimeLabel::Bull, RegimeLabel::Sideways, RegimeLabel::Bear}) {
        table_[slot(regime)] = default_weights(regime);
    }
}

WeightTable::WeightTable(const std::map<std::string, std::map<std::string, double>>& raw)
    : WeightTable() {
    for (const auto& [regime_name, entries] : raw) {
        auto regime = regime_from_string(regime_name);
        if (!regime) {
            throw ConfigError(fmt::format("Unknown regime '{}' in confluence.regime_weights", regime_name));
        }

        WeightVector vector{};
        std::array<bool, kComponentCount> seen{};

        for (const auto& [component_name, weight] : entries) {
            auto component = component_from_string(component_name);
            if (!component) {
                throw ConfigError(fmt::format("Unknown component '{}' in confluence.regime_weights.{}",
                                              component_name, regime_name));
            }
            if (seen[index_of(*component)]) {
                throw ConfigError(fmt::format("Component {} listed twice in confluence.regime_weights.{}",
                                              to_string(*component), regime_name));
            }
            if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
                throw ConfigError(fmt::format("Weight for {} in regime {} must be within [0, 1], got {}",
                                              component_name, regime_name, weight));
            }
            seen[index_of(*component)] = true;
            vector[index_of(*component)] = weight;
        }

        double sum = 0.0;
        for (double w : vector) {
            sum += w;
        }
        if (std::fabs(sum - 1.0) > kSumEpsilon) {
            throw ConfigError(fmt::format("Weights for regime {} sum to {:.8f}, expected 1", regime_name, sum));
        }

        table_[slot(*regime)] = vector;
        spdlog::debug("Loaded weight vector for regime {}", regime_name);
    }
}

const WeightVector& WeightTable::weights_for(RegimeLabel regime) const {
    return table_[slot(regime)];
}
