#include "scoring.hpp"
#include <spdlog/spdlog.h>

ScoringEngine::ScoringEngine(const WeightTable& weights)
    : scorers_(make_default_scorers()), aggregator_(weights) {}

std::array<ComponentScore, kComponentCount> ScoringEngine::score_components(const SymbolInput& input) const {
    static const FeatureSet kNoFeatures;

    std::array<ComponentScore, kComponentCount> scores;
    for (const auto& scorer : scorers_) {
        auto component = scorer->component();
        auto it = input.features.find(component);
        const FeatureSet& features = it != input.features.end() ? it->second : kNoFeatures;
        scores[index_of(component)] = scorer->score(features);
    }
    return scores;
}

ScoreBundle ScoringEngine::build_bundle(const SymbolInput& input,
                                        const Regime& regime,
                                        std::chrono::system_clock::time_point timestamp) const {
    ScoreBundle bundle;
    bundle.symbol = input.symbol;
    bundle.timeframe = input.timeframe;
    bundle.components = score_components(input);
    bundle.regime = regime;
    bundle.patterns = input.patterns;
    bundle.pattern_bars_since = input.pattern_bars_since;
    bundle.timestamp = timestamp;

    auto vol = input.features.find(Component::Volatility);
    if (vol != input.features.end()) {
        bundle.bb_width_pct = vol->second.get("volatility_bb_width_pct_20");
    }

    auto result = aggregator_.aggregate(bundle.components, regime);
    bundle.confluence = result.confluence;
    bundle.confidence = result.confidence;
    bundle.low_confidence = result.low_confidence;

    if (bundle.low_confidence) {
        spdlog::debug("{} {}: only {} component(s) available, confluence {:.1f} is best-effort",
                      bundle.symbol, bundle.timeframe, bundle.available_count(), bundle.confluence);
    }

    return bundle;
}
