#pragma once

#include "confluence.hpp"
#include "scorers.hpp"
#include "types.hpp"
#include "weights.hpp"
#include <array>
#include <chrono>
#include <memory>

// Runs the five component scorers on one symbol and assembles its ScoreBundle.
// Holds no per-symbol state, so one engine may be shared by worker threads.
class ScoringEngine {
public:
    explicit ScoringEngine(const WeightTable& weights);

    std::array<ComponentScore, kComponentCount> score_components(const SymbolInput& input) const;

    ScoreBundle build_bundle(const SymbolInput& input,
                             const Regime& regime,
                             std::chrono::system_clock::time_point timestamp) const;

private:
    std::array<std::unique_ptr<ComponentScorer>, kComponentCount> scorers_;
    ConfluenceAggregator aggregator_;
};
