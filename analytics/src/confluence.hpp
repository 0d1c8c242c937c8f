#pragma once

#include "types.hpp"
#include "weights.hpp"
#include <array>

struct ConfluenceResult {
    double confluence = 50.0;       // [0, 100]
    double confidence = 0.0;        // [0, 1]
    bool low_confidence = true;     // fewer than two components available
    WeightVector effective_weights{};  // renormalized over available components
};

// Combines the five component scores with the regime's weight vector.
// Pure: identical inputs always produce identical output.
class ConfluenceAggregator {
public:
    static constexpr std::size_t kMinAvailableComponents = 2;

    explicit ConfluenceAggregator(const WeightTable& weights);

    ConfluenceResult aggregate(const std::array<ComponentScore, kComponentCount>& scores,
                               const Regime& regime) const;

private:
    const WeightTable& weights_;
};
