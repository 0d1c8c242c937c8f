#include "types.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

std::string to_string(Component component) {
    switch (component) {
        case Component::Trend: return "trend";
        case Component::Volume: return "volume";
        case Component::Volatility: return "volatility";
        case Component::RelativeStrength: return "relative_strength";
        case Component::Positioning: return "positioning";
    }
    return "unknown";
}

std::optional<Component> component_from_string(const std::string& name) {
    static const std::unordered_map<std::string, Component> aliases = {
        {"trend", Component::Trend},
        {"trend_score", Component::Trend},
        {"volume", Component::Volume},
        {"volume_score", Component::Volume},
        {"volatility", Component::Volatility},
        {"volatility_score", Component::Volatility},
        {"rs", Component::RelativeStrength},
        {"rs_score", Component::RelativeStrength},
        {"relative_strength", Component::RelativeStrength},
        {"positioning", Component::Positioning},
        {"positioning_score", Component::Positioning}
    };

    auto it = aliases.find(name);
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

FeatureSet::FeatureSet(std::initializer_list<std::pair<const std::string, double>> values)
    : values_(values) {}

void FeatureSet::set(const std::string& name, double value) {
    values_[name] = value;
}

std::optional<double> FeatureSet::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end() || !std::isfinite(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

bool FeatureSet::contains(const std::string& name) const {
    return values_.find(name) != values_.end();
}

FeatureSet FeatureSet::from_json(const json& j) {
    FeatureSet features;
    if (!j.is_object()) {
        return features;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_number()) {
            features.set(it.key(), it.value().get<double>());
        } else if (it.value().is_boolean()) {
            // has_*_data flags arrive as booleans from some extractors
            features.set(it.key(), it.value().get<bool>() ? 1.0 : 0.0);
        }
    }
    return features;
}

ComponentScore ComponentScore::make(Component component, double value, bool available) {
    ComponentScore score;
    score.component = component;
    score.available = available;
    score.value = std::isfinite(value) ? clamp_value(value, 0.0, 100.0) : 50.0;
    return score;
}

ComponentScore ComponentScore::unavailable(Component component) {
    return make(component, 50.0, false);
}

std::string to_string(RegimeLabel label) {
    switch (label) {
        case RegimeLabel::Bull: return "bull";
        case RegimeLabel::Sideways: return "sideways";
        case RegimeLabel::Bear: return "bear";
    }
    return "unknown";
}

std::optional<RegimeLabel> regime_from_string(const std::string& name) {
    if (name == "bull") return RegimeLabel::Bull;
    if (name == "sideways") return RegimeLabel::Sideways;
    if (name == "bear") return RegimeLabel::Bear;
    return std::nullopt;
}

namespace {
    std::optional<double> optional_number(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) {
            return std::nullopt;
        }
        double value = it->get<double>();
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }
}

MarketHealth MarketHealth::from_json(const json& j) {
    MarketHealth health;
    if (!j.is_object()) {
        return health;
    }
    health.btc_trend = optional_number(j, "btc_trend");
    health.breadth = optional_number(j, "breadth");
    health.risk_on = optional_number(j, "risk_on");
    health.btc_volatility = optional_number(j, "btc_volatility");
    health.avg_positioning = optional_number(j, "avg_positioning");
    return health;
}

std::size_t ScoreBundle::available_count() const {
    std::size_t count = 0;
    for (const auto& c : components) {
        if (c.available) {
            ++count;
        }
    }
    return count;
}

std::string to_string(AlertType type) {
    switch (type) {
        case AlertType::HighConfluence: return "high_confluence";
        case AlertType::VolumeSpike: return "volume_spike";
        case AlertType::SqueezeCandidate: return "squeeze_candidate";
        case AlertType::RegimeChange: return "regime_change";
        case AlertType::RsiDivergence: return "rsi_divergence";
    }
    return "unknown";
}

std::optional<AlertType> alert_type_from_string(const std::string& name) {
    for (auto type : kAllAlertTypes) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string AlertKey::serialize() const {
    return fmt::format("{}|{}|{}", symbol, timeframe, to_string(type));
}

std::optional<AlertKey> AlertKey::parse(const std::string& text) {
    // Timeframes and type names never contain '|', so splitting on the last
    // two separators leaves any '|' inside the symbol intact
    auto last = text.rfind('|');
    if (last == std::string::npos || last == 0) {
        return std::nullopt;
    }
    auto middle = text.rfind('|', last - 1);
    if (middle == std::string::npos) {
        return std::nullopt;
    }

    auto type = alert_type_from_string(text.substr(last + 1));
    if (!type) {
        return std::nullopt;
    }

    AlertKey key;
    key.symbol = text.substr(0, middle);
    key.timeframe = text.substr(middle + 1, last - middle - 1);
    key.type = *type;
    return key;
}

json AlertState::to_json() const {
    json j;
    j["last_fired"] = last_fired ? json(format_iso8601(*last_fired)) : json(nullptr);
    j["last_score"] = last_score;
    j["last_regime"] = last_regime ? json(to_string(*last_regime)) : json(nullptr);
    j["suppression_count"] = suppression_count;
    return j;
}

std::optional<AlertState> AlertState::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    AlertState state;

    auto fired = j.find("last_fired");
    if (fired != j.end() && !fired->is_null()) {
        if (!fired->is_string()) {
            return std::nullopt;
        }
        state.last_fired = parse_iso8601(fired->get<std::string>());
        if (!state.last_fired) {
            return std::nullopt;
        }
    }

    auto score = j.find("last_score");
    if (score != j.end() && score->is_number()) {
        state.last_score = score->get<double>();
    }

    auto regime = j.find("last_regime");
    if (regime != j.end() && regime->is_string()) {
        state.last_regime = regime_from_string(regime->get<std::string>());
    }

    auto suppressed = j.find("suppression_count");
    if (suppressed != j.end() && suppressed->is_number_integer()) {
        state.suppression_count = suppressed->get<int>();
    }

    return state;
}

json AlertEvent::to_json() const {
    json components_json = json::object();
    for (auto c : kAllComponents) {
        components_json[to_string(c)] = components[index_of(c)];
    }

    return json{
        {"type", to_string(type)},
        {"symbol", symbol},
        {"timeframe", timeframe},
        {"confluence_score", confluence_score},
        {"confidence", confidence},
        {"components", components_json},
        {"regime", to_string(regime)},
        {"message", message},
        {"timestamp", format_iso8601(timestamp)},
        {"persisted", persisted}
    };
}

SymbolInput SymbolInput::from_json(const json& j) {
    SymbolInput input;
    input.symbol = j.at("symbol").get<std::string>();
    input.timeframe = j.value("timeframe", std::string("1d"));

    auto features = j.find("features");
    if (features != j.end() && features->is_object()) {
        for (auto it = features->begin(); it != features->end(); ++it) {
            auto component = component_from_string(it.key());
            if (component) {
                input.features[*component] = FeatureSet::from_json(it.value());
            }
        }
    }

    auto patterns = j.find("patterns");
    if (patterns != j.end() && patterns->is_array()) {
        for (const auto& tag : *patterns) {
            if (tag.is_string()) {
                input.patterns.insert(tag.get<std::string>());
            }
        }
    }

    auto bars_since = j.find("pattern_bars_since");
    if (bars_since != j.end() && bars_since->is_object()) {
        for (auto it = bars_since->begin(); it != bars_since->end(); ++it) {
            if (it.value().is_number_integer()) {
                input.pattern_bars_since[it.key()] = it.value().get<int>();
            }
        }
    }

    return input;
}

CycleInput CycleInput::from_json(const json& j) {
    CycleInput input;
    input.timestamp = std::chrono::system_clock::now();

    auto ts = j.find("timestamp");
    if (ts != j.end() && ts->is_string()) {
        auto parsed = parse_iso8601(ts->get<std::string>());
        if (parsed) {
            input.timestamp = *parsed;
        }
    }

    auto health = j.find("market_health");
    if (health != j.end()) {
        input.market_health = MarketHealth::from_json(*health);
    }

    const json& symbols = j.at("symbols");
    if (!symbols.is_array()) {
        throw std::runtime_error("Cycle input 'symbols' must be a list");
    }
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        try {
            input.symbols.push_back(SymbolInput::from_json(symbols[i]));
        } catch (const json::exception& e) {
            ++input.rejected_symbols;
            spdlog::warn("Skipping malformed symbol entry {} in cycle input: {}", i, e.what());
        }
    }
    return input;
}
