#pragma once

#include "alert_state.hpp"
#include "config.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Turns ScoreBundles into de-duplicated AlertEvents.
//
// Every (symbol, timeframe, alert_type) key runs the same sequence on every
// evaluation: qualifying condition, cooldown, minimum score change, fire.
// The key is never closed; a key without stored state is in its
// "no prior alert" phase. State is only written through the AlertStateStore,
// under that key's lock.
class AlertEvaluator {
public:
    static constexpr const char* kGlobalSymbol = "__GLOBAL__";
    static constexpr const char* kGlobalTimeframe = "*";

    AlertEvaluator(const AlertConfig& config, AlertStateStore& store);

    // Symbol-level alert types for one bundle, plus regime_change when the
    // regime change scope is per symbol. Zero, one or several events.
    std::vector<AlertEvent> evaluate(const ScoreBundle& bundle, std::chrono::system_clock::time_point now);

    // Market-wide regime_change under the __GLOBAL__ key
    std::optional<AlertEvent> evaluate_regime(const Regime& regime, std::chrono::system_clock::time_point now);

    // Step 1 for the bundle-driven types; regime_change depends on stored state
    bool qualifies(AlertType type, const ScoreBundle& bundle) const;

    // Fired events whose state could not be recorded, since construction
    std::size_t unpersisted_count() const { return unpersisted_.load(); }

    // Between begin_cycle() and commit_cycle()/rollback_cycle() every key
    // keeps the state it had before its first write in the cycle.
    // rollback_cycle() restores those records and returns false if any
    // restore failed.
    void begin_cycle();
    void commit_cycle();
    bool rollback_cycle();

private:
    // Divergence tag and bars since it triggered
    std::optional<std::pair<std::string, int>> matching_divergence(const ScoreBundle& bundle) const;

    // Steps 2-5 for one key; condition already holds for bundle-driven types
    std::optional<AlertEvent> run_key(const AlertKey& key, AlertEvent candidate,
                                      std::chrono::system_clock::time_point now);

    // put() with one retry; previous is the state read under the key lock
    bool persist(const AlertKey& key, const AlertState& state, const std::optional<AlertState>& previous);

    static bool uses_score_delta(AlertType type);

    AlertEvent make_event(AlertType type, const ScoreBundle& bundle) const;
    std::string describe(AlertType type, const ScoreBundle& bundle) const;

    const AlertConfig& config_;
    AlertStateStore& store_;
    std::atomic<std::size_t> unpersisted_{0};

    struct JournalEntry {
        AlertKey key;
        std::optional<AlertState> previous;
    };

    std::mutex journal_mutex_;
    bool journaling_ = false;
    std::map<std::string, JournalEntry> journal_;
};
