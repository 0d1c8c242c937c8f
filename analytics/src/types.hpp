#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Scored components, in canonical order
enum class Component {
    Trend,
    Volume,
    Volatility,
    RelativeStrength,
    Positioning
};

constexpr std::size_t kComponentCount = 5;

constexpr std::array<Component, kComponentCount> kAllComponents = {
    Component::Trend,
    Component::Volume,
    Component::Volatility,
    Component::RelativeStrength,
    Component::Positioning
};

constexpr std::size_t index_of(Component component) {
    return static_cast<std::size_t>(component);
}

std::string to_string(Component component);

// Accepts the canonical names plus the short/"_score" aliases used in configs
std::optional<Component> component_from_string(const std::string& name);

// Per (symbol, timeframe, component) feature values produced upstream
class FeatureSet {
public:
    FeatureSet() = default;
    FeatureSet(std::initializer_list<std::pair<const std::string, double>> values);

    void set(const std::string& name, double value);

    // Absent for missing keys and for non-finite values
    std::optional<double> get(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool empty() const { return values_.empty(); }
    std::size_t size() const { return values_.size(); }

    // Non-numeric JSON values are dropped, which makes them count as missing
    static FeatureSet from_json(const nlohmann::json& j);

private:
    std::unordered_map<std::string, double> values_;
};

struct ComponentScore {
    Component component = Component::Trend;
    double value = 50.0;
    bool available = false;
    std::map<std::string, double> details;

    // Clamps into [0, 100]; non-finite values fall back to neutral
    static ComponentScore make(Component component, double value, bool available = true);
    static ComponentScore unavailable(Component component);
};

enum class RegimeLabel {
    Bull,
    Sideways,
    Bear
};

std::string to_string(RegimeLabel label);
std::optional<RegimeLabel> regime_from_string(const std::string& name);

struct Regime {
    RegimeLabel label = RegimeLabel::Sideways;
    double confidence = 0.0;  // [0, 1]
    double index = 50.0;      // composite market-health index it was derived from
};

// Market-regime collaborator summary, shared by every symbol in a cycle
struct MarketHealth {
    std::optional<double> btc_trend;
    std::optional<double> breadth;
    std::optional<double> risk_on;
    std::optional<double> btc_volatility;
    std::optional<double> avg_positioning;

    static MarketHealth from_json(const nlohmann::json& j);
};

using WeightVector = std::array<double, kComponentCount>;

struct ScoreBundle {
    std::string symbol;
    std::string timeframe;
    std::array<ComponentScore, kComponentCount> components;
    double confluence = 50.0;
    double confidence = 0.0;
    bool low_confidence = true;
    Regime regime;
    std::set<std::string> patterns;
    std::map<std::string, int> pattern_bars_since;
    std::optional<double> bb_width_pct;
    std::chrono::system_clock::time_point timestamp;

    const ComponentScore& component(Component c) const { return components[index_of(c)]; }
    double score(Component c) const { return components[index_of(c)].value; }
    std::size_t available_count() const;
};

enum class AlertType {
    HighConfluence,
    VolumeSpike,
    SqueezeCandidate,
    RegimeChange,
    RsiDivergence
};

constexpr std::array<AlertType, 5> kAllAlertTypes = {
    AlertType::HighConfluence,
    AlertType::VolumeSpike,
    AlertType::SqueezeCandidate,
    AlertType::RegimeChange,
    AlertType::RsiDivergence
};

std::string to_string(AlertType type);
std::optional<AlertType> alert_type_from_string(const std::string& name);

struct AlertKey {
    std::string symbol;
    std::string timeframe;
    AlertType type = AlertType::HighConfluence;

    // "symbol|timeframe|alert_type"
    std::string serialize() const;
    static std::optional<AlertKey> parse(const std::string& text);

    bool operator==(const AlertKey& other) const {
        return symbol == other.symbol && timeframe == other.timeframe && type == other.type;
    }
};

struct AlertState {
    std::optional<std::chrono::system_clock::time_point> last_fired;
    double last_score = 0.0;
    std::optional<RegimeLabel> last_regime;
    int suppression_count = 0;

    nlohmann::json to_json() const;
    static std::optional<AlertState> from_json(const nlohmann::json& j);
};

struct AlertEvent {
    AlertType type = AlertType::HighConfluence;
    std::string symbol;
    std::string timeframe;
    double confluence_score = 0.0;
    double confidence = 0.0;
    std::array<double, kComponentCount> components{};
    RegimeLabel regime = RegimeLabel::Sideways;
    std::string message;
    bool persisted = true;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};

// One symbol's slice of the cycle input
struct SymbolInput {
    std::string symbol;
    std::string timeframe;
    std::map<Component, FeatureSet> features;
    std::set<std::string> patterns;
    std::map<std::string, int> pattern_bars_since;

    static SymbolInput from_json(const nlohmann::json& j);
};

struct CycleInput {
    std::chrono::system_clock::time_point timestamp;
    MarketHealth market_health;
    std::vector<SymbolInput> symbols;
    std::size_t rejected_symbols = 0;  // malformed entries skipped while parsing

    static CycleInput from_json(const nlohmann::json& j);
};
