#include "alert_evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    std::string upper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
}

AlertEvaluator::AlertEvaluator(const AlertConfig& config, AlertStateStore& store)
    : config_(config), store_(store) {}

bool AlertEvaluator::uses_score_delta(AlertType type) {
    switch (type) {
        case AlertType::HighConfluence:
        case AlertType::VolumeSpike:
        case AlertType::SqueezeCandidate:
            return true;
        case AlertType::RegimeChange:
        case AlertType::RsiDivergence:
            return false;
    }
    return true;
}

std::optional<std::pair<std::string, int>> AlertEvaluator::matching_divergence(const ScoreBundle& bundle) const {
    if (!config_.rsi_divergence_timeframes.empty() &&
        config_.rsi_divergence_timeframes.count(bundle.timeframe) == 0) {
        return std::nullopt;
    }

    for (const auto& kind : config_.rsi_divergence_kinds) {
        if (bundle.patterns.count(kind) == 0) {
            continue;
        }
        // A tag without a bar count is taken as triggering on the last bar
        auto it = bundle.pattern_bars_since.find(kind);
        int bars = it != bundle.pattern_bars_since.end() ? it->second : 0;
        if (bars >= 0 && bars <= config_.rsi_divergence_max_bars_from_last) {
            return std::make_pair(kind, bars);
        }
    }
    return std::nullopt;
}

bool AlertEvaluator::qualifies(AlertType type, const ScoreBundle& bundle) const {
    switch (type) {
        case AlertType::HighConfluence:
            return bundle.confluence >= config_.min_confluence_score &&
                   bundle.score(Component::Trend) >= config_.min_trend_score &&
                   bundle.score(Component::Volume) >= config_.min_volume_score &&
                   bundle.score(Component::Positioning) >= config_.min_positioning_score;

        case AlertType::VolumeSpike:
            return bundle.score(Component::Volume) >= config_.volume_spike_min_volume_score;

        case AlertType::SqueezeCandidate:
            return bundle.bb_width_pct.has_value() &&
                   bundle.score(Component::Volatility) <= config_.squeeze_max_vol_score &&
                   *bundle.bb_width_pct <= config_.squeeze_max_bbw_pct;

        case AlertType::RsiDivergence:
            return matching_divergence(bundle).has_value();

        case AlertType::RegimeChange:
            return false;
    }
    return false;
}

std::string AlertEvaluator::describe(AlertType type, const ScoreBundle& bundle) const {
    std::string summary = fmt::format(
        "CS: {:.1f} | Trend: {:.1f} | Vol: {:.1f} | Volu: {:.1f} | RS: {:.1f} | Pos: {:.1f} | "
        "Regime: {} (confidence {:.2f})",
        bundle.confluence,
        bundle.score(Component::Trend),
        bundle.score(Component::Volatility),
        bundle.score(Component::Volume),
        bundle.score(Component::RelativeStrength),
        bundle.score(Component::Positioning),
        upper(to_string(bundle.regime.label)),
        bundle.regime.confidence);

    if (bundle.low_confidence) {
        summary += " [partial data]";
    }

    switch (type) {
        case AlertType::HighConfluence:
            return fmt::format("High confluence on {} {}. {}", bundle.symbol, bundle.timeframe, summary);
        case AlertType::VolumeSpike:
            return fmt::format("Volume spike on {} {}. {}", bundle.symbol, bundle.timeframe, summary);
        case AlertType::SqueezeCandidate:
            return fmt::format("Squeeze candidate on {} {} (BB width {:.2f}%). {}",
                               bundle.symbol, bundle.timeframe, bundle.bb_width_pct.value_or(0.0), summary);
        case AlertType::RsiDivergence: {
            auto divergence = matching_divergence(bundle);
            std::string kind = divergence ? divergence->first : "rsi_divergence";
            int bars = divergence ? divergence->second : 0;
            return fmt::format("{} on {} {} ({} bar(s) ago). {}",
                               upper(kind), bundle.symbol, bundle.timeframe, bars, summary);
        }
        case AlertType::RegimeChange:
            return summary;
    }
    return summary;
}

AlertEvent AlertEvaluator::make_event(AlertType type, const ScoreBundle& bundle) const {
    AlertEvent event;
    event.type = type;
    event.symbol = bundle.symbol;
    event.timeframe = bundle.timeframe;
    event.confluence_score = bundle.confluence;
    event.confidence = bundle.confidence;
    for (auto c : kAllComponents) {
        event.components[index_of(c)] = bundle.score(c);
    }
    event.regime = bundle.regime.label;
    event.message = describe(type, bundle);
    event.timestamp = bundle.timestamp;
    return event;
}

std::vector<AlertEvent> AlertEvaluator::evaluate(const ScoreBundle& bundle,
                                                 std::chrono::system_clock::time_point now) {
    std::vector<AlertEvent> events;
    if (!config_.enabled) {
        return events;
    }

    bool symbol_types_allowed = true;
    if (config_.require_uptrend_regime && bundle.regime.label == RegimeLabel::Bear) {
        spdlog::debug("{} {}: regime is bear, symbol alerts disabled by require_uptrend_regime",
                      bundle.symbol, bundle.timeframe);
        symbol_types_allowed = false;
    } else if (bundle.confidence < config_.min_confidence) {
        spdlog::debug("{} {}: confidence {:.3f} below floor {:.3f}, not alerting",
                      bundle.symbol, bundle.timeframe, bundle.confidence, config_.min_confidence);
        symbol_types_allowed = false;
    }

    if (symbol_types_allowed) {
        for (auto type : {AlertType::HighConfluence, AlertType::VolumeSpike,
                          AlertType::SqueezeCandidate, AlertType::RsiDivergence}) {
            // Failed condition: no transition, state untouched
            if (!config_.type_enabled(type) || !qualifies(type, bundle)) {
                continue;
            }
            AlertKey key{bundle.symbol, bundle.timeframe, type};
            auto event = run_key(key, make_event(type, bundle), now);
            if (event) {
                events.push_back(std::move(*event));
            }
        }
    }

    if (config_.regime_change_scope == RegimeChangeScope::Symbol &&
        config_.type_enabled(AlertType::RegimeChange)) {
        AlertKey key{bundle.symbol, bundle.timeframe, AlertType::RegimeChange};
        auto event = run_key(key, make_event(AlertType::RegimeChange, bundle), now);
        if (event) {
            events.push_back(std::move(*event));
        }
    }

    return events;
}

std::optional<AlertEvent> AlertEvaluator::evaluate_regime(const Regime& regime,
                                                          std::chrono::system_clock::time_point now) {
    if (!config_.enabled || !config_.type_enabled(AlertType::RegimeChange)) {
        return std::nullopt;
    }

    AlertEvent candidate;
    candidate.type = AlertType::RegimeChange;
    candidate.symbol = kGlobalSymbol;
    candidate.timeframe = kGlobalTimeframe;
    candidate.confluence_score = 0.0;
    candidate.confidence = regime.confidence;
    candidate.regime = regime.label;
    candidate.message = fmt::format("Market-health index {:.1f}, regime confidence {:.2f}",
                                    regime.index, regime.confidence);
    candidate.timestamp = now;

    AlertKey key{kGlobalSymbol, kGlobalTimeframe, AlertType::RegimeChange};
    return run_key(key, std::move(candidate), now);
}

std::optional<AlertEvent> AlertEvaluator::run_key(const AlertKey& key, AlertEvent candidate,
                                                  std::chrono::system_clock::time_point now) {
    auto guard = store_.lock(key);
    std::optional<AlertState> state = store_.get(key);

    if (key.type == AlertType::RegimeChange) {
        if (!state || !state->last_regime) {
            // First observation is a baseline, not a change
            AlertState baseline = state.value_or(AlertState{});
            baseline.last_regime = candidate.regime;
            if (!persist(key, baseline, state)) {
                spdlog::warn("Could not record regime baseline for {}", key.serialize());
            }
            return std::nullopt;
        }
        if (*state->last_regime == candidate.regime) {
            return std::nullopt;
        }
        candidate.message = fmt::format("Market regime changed from {} to {}. {}",
                                        upper(to_string(*state->last_regime)),
                                        upper(to_string(candidate.regime)),
                                        candidate.message);
    }

    bool has_prior_alert = state && state->last_fired;

    if (has_prior_alert) {
        const auto cooldown = std::chrono::minutes(config_.cooldown_minutes);
        const auto elapsed = now - *state->last_fired;

        bool cooling_down = elapsed < cooldown;
        bool below_delta = !cooling_down && uses_score_delta(key.type) &&
                           std::fabs(candidate.confluence_score - state->last_score) < config_.min_cs_delta;

        if (cooling_down || below_delta) {
            AlertState suppressed = *state;
            suppressed.suppression_count += 1;
            if (!persist(key, suppressed, state)) {
                spdlog::warn("Could not record suppression for {}", key.serialize());
            }
            spdlog::debug("Suppressed {} ({}; {} consecutive)", key.serialize(),
                          cooling_down ? "cooldown" : "below min_cs_delta", suppressed.suppression_count);
            return std::nullopt;
        }
    }

    AlertState fired;
    fired.last_fired = now;
    fired.last_score = candidate.confluence_score;
    fired.last_regime = candidate.regime;
    fired.suppression_count = 0;

    candidate.timestamp = now;
    candidate.persisted = persist(key, fired, state);
    if (!candidate.persisted) {
        unpersisted_.fetch_add(1);
        spdlog::warn("Alert {} fired but its state could not be persisted", key.serialize());
    }

    return candidate;
}

bool AlertEvaluator::persist(const AlertKey& key, const AlertState& state,
                             const std::optional<AlertState>& previous) {
    {
        std::lock_guard<std::mutex> lock(journal_mutex_);
        if (journaling_) {
            journal_.emplace(key.serialize(), JournalEntry{key, previous});
        }
    }

    if (store_.put(key, state)) {
        return true;
    }
    spdlog::warn("Alert state write for {} failed, retrying once", key.serialize());
    return store_.put(key, state);
}

void AlertEvaluator::begin_cycle() {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    journal_.clear();
    journaling_ = true;
}

void AlertEvaluator::commit_cycle() {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    journal_.clear();
    journaling_ = false;
}

bool AlertEvaluator::rollback_cycle() {
    std::map<std::string, JournalEntry> journal;
    {
        std::lock_guard<std::mutex> lock(journal_mutex_);
        journal.swap(journal_);
        journaling_ = false;
    }

    bool restored = true;
    for (const auto& [id, entry] : journal) {
        auto guard = store_.lock(entry.key);
        bool ok = entry.previous ? store_.put(entry.key, *entry.previous) : store_.erase(entry.key);
        if (!ok) {
            restored = false;
            spdlog::error("Could not roll back alert state for {}", id);
        }
    }

    spdlog::info("Rolled back alert state for {} key(s)", journal.size());
    return restored;
}
