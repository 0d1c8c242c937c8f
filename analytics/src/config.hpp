#pragma once

#include "types.hpp"
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Fatal at startup: bad weights, out-of-range thresholds, unknown keys
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RegimeChangeScope {
    Global,
    Symbol
};

struct AlertConfig {
    bool enabled = true;
    std::map<AlertType, bool> types = {
        {AlertType::HighConfluence, true},
        {AlertType::VolumeSpike, true},
        {AlertType::SqueezeCandidate, true},
        {AlertType::RegimeChange, true},
        {AlertType::RsiDivergence, true}
    };

    // High confluence gates
    double min_confluence_score = 60.0;
    double min_trend_score = 55.0;
    double min_volume_score = 50.0;
    double min_positioning_score = 50.0;
    bool require_uptrend_regime = false;

    // Dedupe
    double min_cs_delta = 3.0;
    int cooldown_minutes = 60;
    double min_confidence = 0.01;

    // Per-type thresholds
    double volume_spike_min_volume_score = 75.0;
    double squeeze_max_vol_score = 40.0;
    double squeeze_max_bbw_pct = 6.0;
    int rsi_divergence_max_bars_from_last = 1;
    std::set<std::string> rsi_divergence_timeframes = {"4h"};
    std::set<std::string> rsi_divergence_kinds = {"rsi_bullish_divergence", "rsi_bearish_divergence"};

    RegimeChangeScope regime_change_scope = RegimeChangeScope::Global;

    // State persistence
    std::string state_file = "alerts_state.json";
    bool state_write_through = false;

    bool type_enabled(AlertType type) const;
};

struct RegimeThresholds {
    double bull_min_risk_on = 65.0;
    double bear_max_risk_on = 35.0;
};

struct Config {
    // Service configuration
    std::string service_name = "confluence_scanner";
    std::string log_level = "info";
    int thread_pool_size = 4;

    // Redis alert stream
    bool redis_enabled = false;
    std::string redis_url = "redis://localhost:6379";
    std::string stream_alerts = "scout.alerts";
    long long stream_maxlen = 10000;  // approximate MAXLEN trim, 0 disables

    AlertConfig alerts;
    RegimeThresholds regimes;

    // Raw confluence.regime_weights; WeightTable validates these at startup
    std::map<std::string, std::map<std::string, double>> regime_weights;

    // Load from a JSON file; throws ConfigError
    void load(const std::string& path);

    // Apply a parsed JSON document on top of the defaults; throws ConfigError
    void load_from_json(const nlohmann::json& j);

    // Load from environment variables
    void load_from_env();

    // Range checks; throws ConfigError
    void validate() const;
};
