#pragma once

#include "alert_evaluator.hpp"
#include "alert_sink.hpp"
#include "alert_state.hpp"
#include "config.hpp"
#include "regime.hpp"
#include "scoring.hpp"
#include "types.hpp"
#include "weights.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct CycleReport {
    Regime regime;
    std::vector<ScoreBundle> bundles;   // input order; symbols that failed are absent
    std::vector<AlertEvent> events;     // dispatch order
    std::vector<std::string> warnings;
    std::size_t failed_symbols = 0;     // scoring failures plus rejected input entries
    std::size_t dispatched = 0;         // events accepted by at least one sink
    bool cancelled = false;
    bool state_flushed = false;
};

// Runs one batch scan cycle: classify the regime, score every symbol on a
// worker pool, apply alert decisions in input order, flush the alert state,
// then hand the ordered events to the sinks.
class AnalyticsService {
public:
    // Throws ConfigError when the configured weight vectors are invalid
    explicit AnalyticsService(const Config& config);
    AnalyticsService(const Config& config, std::unique_ptr<AlertStateStore> store);
    ~AnalyticsService() = default;

    void add_sink(std::shared_ptr<AlertSink> sink);

    // Uses the input timestamp as "now"
    CycleReport run_cycle(const CycleInput& input);
    CycleReport run_cycle(const CycleInput& input, std::chrono::system_clock::time_point now);

    // Abort the running (or next) cycle; checked between symbols. Alert
    // state touched by a cancelled cycle is restored.
    void request_cancel() { cancel_requested_ = true; }
    bool cancel_requested() const { return cancel_requested_.load(); }

    AlertStateStore& state_store() { return *store_; }
    const WeightTable& weight_table() const { return weights_; }

    // Non-copyable
    AnalyticsService(const AnalyticsService&) = delete;
    AnalyticsService& operator=(const AnalyticsService&) = delete;

private:
    CycleReport run_cycle_steps(const CycleInput& input, std::chrono::system_clock::time_point now);

    std::vector<std::optional<ScoreBundle>> score_symbols(const std::vector<SymbolInput>& symbols,
                                                          const Regime& regime,
                                                          std::chrono::system_clock::time_point now,
                                                          std::size_t& failed);

    bool flush_state(CycleReport& report);
    void dispatch(CycleReport& report);

    // Configuration
    Config config_;

    // Service components
    WeightTable weights_;
    RegimeClassifier regime_classifier_;
    ScoringEngine scoring_engine_;
    std::unique_ptr<AlertStateStore> store_;
    AlertEvaluator evaluator_;
    std::vector<std::shared_ptr<AlertSink>> sinks_;

    std::atomic<bool> cancel_requested_{false};
};
