#include "confluence.hpp"
#include "util.hpp"

ConfluenceAggregator::ConfluenceAggregator(const WeightTable& weights)
    : weights_(weights) {}

ConfluenceResult ConfluenceAggregator::aggregate(const std::array<ComponentScore, kComponentCount>& scores,
                                                 const Regime& regime) const {
    const WeightVector& weights = weights_.weights_for(regime.label);

    ConfluenceResult result;

    double available_weight = 0.0;
    std::size_t available = 0;
    for (auto c : kAllComponents) {
        if (scores[index_of(c)].available) {
            available_weight += weights[index_of(c)];
            ++available;
        }
    }

    result.low_confidence = available < kMinAvailableComponents;

    // Nothing usable (or only zero-weighted components): neutral, no confidence
    if (available == 0 || available_weight <= 0.0) {
        result.confluence = 50.0;
        result.confidence = 0.0;
        result.low_confidence = true;
        return result;
    }

    double weighted_sum = 0.0;
    for (auto c : kAllComponents) {
        const auto& score = scores[index_of(c)];
        if (!score.available) {
            continue;
        }
        double w = weights[index_of(c)] / available_weight;
        result.effective_weights[index_of(c)] = w;
        weighted_sum += w * score.value;
    }

    result.confluence = clamp_value(weighted_sum, 0.0, 100.0);
    result.confidence = clamp_value(available_weight * regime.confidence, 0.0, 1.0);
    return result;
}
