#include "config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    const json& section_of(const json& j, const char* key) {
        static const json empty = json::object();
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return empty;
        }
        if (!it->is_object()) {
            throw ConfigError(fmt::format("'{}' must be an object", key));
        }
        return *it;
    }

    double read_number(const json& section, const char* key, const std::string& prefix, double current) {
        auto it = section.find(key);
        if (it == section.end()) {
            return current;
        }
        if (!it->is_number() || !std::isfinite(it->get<double>())) {
            throw ConfigError(fmt::format("{}.{} must be a finite number", prefix, key));
        }
        return it->get<double>();
    }

    int read_int(const json& section, const char* key, const std::string& prefix, int current) {
        auto it = section.find(key);
        if (it == section.end()) {
            return current;
        }
        if (!it->is_number_integer()) {
            throw ConfigError(fmt::format("{}.{} must be an integer", prefix, key));
        }
        return it->get<int>();
    }

    long long read_long(const json& section, const char* key, const std::string& prefix, long long current) {
        auto it = section.find(key);
        if (it == section.end()) {
            return current;
        }
        if (!it->is_number_integer()) {
            throw ConfigError(fmt::format("{}.{} must be an integer", prefix, key));
        }
        return it->get<long long>();
    }

    bool read_bool(const json& section, const char* key, const std::string& prefix, bool current) {
        auto it = section.find(key);
        if (it == section.end()) {
            return current;
        }
        if (!it->is_boolean()) {
            throw ConfigError(fmt::format("{}.{} must be a boolean", prefix, key));
        }
        return it->get<bool>();
    }

    std::string read_string(const json& section, const char* key, const std::string& prefix,
                            const std::string& current) {
        auto it = section.find(key);
        if (it == section.end()) {
            return current;
        }
        if (!it->is_string()) {
            throw ConfigError(fmt::format("{}.{} must be a string", prefix, key));
        }
        return it->get<std::string>();
    }

    // Accepts either a single string or a list of strings
    std::set<std::string> read_string_set(const json& value, const std::string& name) {
        std::set<std::string> result;
        if (value.is_string()) {
            result.insert(value.get<std::string>());
            return result;
        }
        if (!value.is_array()) {
            throw ConfigError(fmt::format("{} must be a string or a list of strings", name));
        }
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw ConfigError(fmt::format("{} must only contain strings", name));
            }
            result.insert(item.get<std::string>());
        }
        return result;
    }

    void check_score_range(double value, const char* name) {
        if (value < 0.0 || value > 100.0) {
            throw ConfigError(fmt::format("alerts.{} must be within [0, 100], got {}", name, value));
        }
    }
}

bool AlertConfig::type_enabled(AlertType type) const {
    auto it = types.find(type);
    return it == types.end() || it->second;
}

void Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError(fmt::format("Cannot open configuration file {}", path));
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(fmt::format("Malformed configuration file {}: {}", path, e.what()));
    }

    load_from_json(j);
    load_from_env();
    validate();
}

void Config::load_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    // Service configuration
    const json& service = section_of(j, "service");
    service_name = read_string(service, "name", "service", service_name);
    log_level = read_string(service, "log_level", "service", log_level);
    thread_pool_size = read_int(service, "thread_pool_size", "service", thread_pool_size);

    // Redis configuration
    const json& redis = section_of(j, "redis");
    redis_enabled = read_bool(redis, "enabled", "redis", redis_enabled);
    redis_url = read_string(redis, "url", "redis", redis_url);
    stream_alerts = read_string(redis, "stream_alerts", "redis", stream_alerts);
    stream_maxlen = read_long(redis, "stream_maxlen", "redis", stream_maxlen);

    // Alert thresholds
    const json& a = section_of(j, "alerts");
    alerts.enabled = read_bool(a, "enabled", "alerts", alerts.enabled);
    alerts.min_confluence_score = read_number(a, "min_confluence_score", "alerts", alerts.min_confluence_score);
    alerts.min_trend_score = read_number(a, "min_trend_score", "alerts", alerts.min_trend_score);
    alerts.min_volume_score = read_number(a, "min_volume_score", "alerts", alerts.min_volume_score);
    alerts.min_positioning_score = read_number(a, "min_positioning_score", "alerts", alerts.min_positioning_score);
    alerts.require_uptrend_regime = read_bool(a, "require_uptrend_regime", "alerts", alerts.require_uptrend_regime);
    alerts.min_cs_delta = read_number(a, "min_cs_delta", "alerts", alerts.min_cs_delta);
    alerts.cooldown_minutes = read_int(a, "cooldown_minutes", "alerts", alerts.cooldown_minutes);
    alerts.min_confidence = read_number(a, "min_confidence", "alerts", alerts.min_confidence);
    alerts.volume_spike_min_volume_score =
        read_number(a, "volume_spike_min_volume_score", "alerts", alerts.volume_spike_min_volume_score);
    alerts.squeeze_max_vol_score = read_number(a, "squeeze_max_vol_score", "alerts", alerts.squeeze_max_vol_score);
    alerts.squeeze_max_bbw_pct = read_number(a, "squeeze_max_bbw_pct", "alerts", alerts.squeeze_max_bbw_pct);
    alerts.rsi_divergence_max_bars_from_last =
        read_int(a, "rsi_divergence_max_bars_from_last", "alerts", alerts.rsi_divergence_max_bars_from_last);
    alerts.state_file = read_string(a, "state_file", "alerts", alerts.state_file);
    alerts.state_write_through = read_bool(a, "state_write_through", "alerts", alerts.state_write_through);

    // Either a list of timeframes or the older single-timeframe key
    auto tfs = a.find("rsi_divergence_timeframes");
    if (tfs != a.end()) {
        alerts.rsi_divergence_timeframes = read_string_set(*tfs, "alerts.rsi_divergence_timeframes");
    } else if (a.contains("rsi_divergence_timeframe")) {
        alerts.rsi_divergence_timeframes =
            read_string_set(a.at("rsi_divergence_timeframe"), "alerts.rsi_divergence_timeframe");
    }

    auto kinds = a.find("rsi_divergence_kinds");
    if (kinds != a.end()) {
        alerts.rsi_divergence_kinds = read_string_set(*kinds, "alerts.rsi_divergence_kinds");
    }

    std::string scope = read_string(a, "regime_change_scope", "alerts", "global");
    if (scope == "global") {
        alerts.regime_change_scope = RegimeChangeScope::Global;
    } else if (scope == "symbol") {
        alerts.regime_change_scope = RegimeChangeScope::Symbol;
    } else {
        throw ConfigError(fmt::format("alerts.regime_change_scope must be 'global' or 'symbol', got '{}'", scope));
    }

    const json& types = section_of(a, "types");
    for (auto it = types.begin(); it != types.end(); ++it) {
        auto type = alert_type_from_string(it.key());
        if (!type) {
            throw ConfigError(fmt::format("Unknown alert type '{}' in alerts.types", it.key()));
        }
        if (!it.value().is_boolean()) {
            throw ConfigError(fmt::format("alerts.types.{} must be a boolean", it.key()));
        }
        alerts.types[*type] = it.value().get<bool>();
    }

    // Regime bands
    const json& r = section_of(j, "regimes");
    regimes.bull_min_risk_on = read_number(r, "bull_min_risk_on", "regimes", regimes.bull_min_risk_on);
    regimes.bear_max_risk_on = read_number(r, "bear_max_risk_on", "regimes", regimes.bear_max_risk_on);

    // Regime weight vectors
    const json& confluence = section_of(j, "confluence");
    const json& weights = section_of(confluence, "regime_weights");
    for (auto regime = weights.begin(); regime != weights.end(); ++regime) {
        if (!regime.value().is_object()) {
            throw ConfigError(fmt::format("confluence.regime_weights.{} must be an object", regime.key()));
        }
        std::map<std::string, double> vector;
        for (auto w = regime.value().begin(); w != regime.value().end(); ++w) {
            if (!w.value().is_number()) {
                throw ConfigError(fmt::format("confluence.regime_weights.{}.{} must be a number",
                                              regime.key(), w.key()));
            }
            vector[w.key()] = w.value().get<double>();
        }
        regime_weights[regime.key()] = vector;
    }
}

void Config::load_from_env() {
    log_level = get_env("LOG_LEVEL", log_level);
    thread_pool_size = get_env_int("THREAD_POOL_SIZE", thread_pool_size);
    alerts.state_file = get_env("STATE_FILE", alerts.state_file);
    redis_url = get_env("REDIS_URL", redis_url);
    stream_alerts = get_env("STREAM_ALERTS", stream_alerts);
}

void Config::validate() const {
    check_score_range(alerts.min_confluence_score, "min_confluence_score");
    check_score_range(alerts.min_trend_score, "min_trend_score");
    check_score_range(alerts.min_volume_score, "min_volume_score");
    check_score_range(alerts.min_positioning_score, "min_positioning_score");
    check_score_range(alerts.volume_spike_min_volume_score, "volume_spike_min_volume_score");
    check_score_range(alerts.squeeze_max_vol_score, "squeeze_max_vol_score");
    check_score_range(alerts.min_cs_delta, "min_cs_delta");

    if (alerts.cooldown_minutes < 0) {
        throw ConfigError("alerts.cooldown_minutes must not be negative");
    }
    if (alerts.min_confidence < 0.0 || alerts.min_confidence > 1.0) {
        throw ConfigError("alerts.min_confidence must be within [0, 1]");
    }
    if (alerts.squeeze_max_bbw_pct < 0.0) {
        throw ConfigError("alerts.squeeze_max_bbw_pct must not be negative");
    }
    if (alerts.rsi_divergence_max_bars_from_last < 0) {
        throw ConfigError("alerts.rsi_divergence_max_bars_from_last must not be negative");
    }
    if (alerts.state_file.empty()) {
        throw ConfigError("alerts.state_file cannot be empty");
    }

    if (regimes.bear_max_risk_on < 0.0 || regimes.bull_min_risk_on > 100.0 ||
        regimes.bear_max_risk_on >= regimes.bull_min_risk_on) {
        throw ConfigError(fmt::format(
            "regimes bands must satisfy 0 <= bear_max_risk_on < bull_min_risk_on <= 100, got {} / {}",
            regimes.bear_max_risk_on, regimes.bull_min_risk_on));
    }

    if (thread_pool_size <= 0) {
        throw ConfigError("service.thread_pool_size must be positive");
    }
    if (stream_maxlen < 0) {
        throw ConfigError("redis.stream_maxlen must not be negative");
    }

    if (redis_enabled && redis_url.empty()) {
        throw ConfigError("redis.url is required when redis.enabled is true");
    }

    spdlog::debug("Configuration validated successfully");
}
