#pragma once

#include "types.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

// Maps one component's FeatureSet to a bounded score. Implementations are
// pure: no I/O, no state, deterministic.
class ComponentScorer {
public:
    virtual ~ComponentScorer() = default;

    ComponentScore score(const FeatureSet& features) const;

    virtual Component component() const = 0;

protected:
    // Features that must be present and finite
    virtual std::vector<std::string> required_features() const = 0;

    // Optional has_*_data flag; a value of 0 marks the score unavailable
    virtual std::vector<std::string> availability_flags() const { return {}; }

    // Called only when every required feature is present
    virtual ComponentScore compute(const FeatureSet& features) const = 0;
};

class TrendScorer : public ComponentScorer {
public:
    Component component() const override { return Component::Trend; }

    // alignment -1/0/+1 -> 0/50/100
    static double ma_alignment_score(double alignment);
    // Full marks within +/-ideal_band% of the MA, minus 5 points per extra percent
    static double extension_score(double distance_pct, double ideal_band = 5.0);
    static double slope_score(double slope_pct, double max_abs = 5.0);

protected:
    std::vector<std::string> required_features() const override;
    std::vector<std::string> availability_flags() const override;
    ComponentScore compute(const FeatureSet& features) const override;
};

class VolumeScorer : public ComponentScorer {
public:
    Component component() const override { return Component::Volume; }

    // Sweet spot 1.5-3.0x relative volume, tapering to 70 above it
    static double rvol_score(double rvol, double ideal_low = 1.5, double ideal_high = 3.0);
    static double trend_slope_score(double slope_pct, double max_abs = 20.0);

protected:
    std::vector<std::string> required_features() const override;
    std::vector<std::string> availability_flags() const override;
    ComponentScore compute(const FeatureSet& features) const override;
};

// Higher score means tighter, contracting volatility
class VolatilityScorer : public ComponentScorer {
public:
    Component component() const override { return Component::Volatility; }

    static double inverse_scale_score(double x, double scale);
    static double contraction_ratio_score(double ratio);

protected:
    std::vector<std::string> required_features() const override;
    std::vector<std::string> availability_flags() const override;
    ComponentScore compute(const FeatureSet& features) const override;
};

class RelativeStrengthScorer : public ComponentScorer {
public:
    Component component() const override { return Component::RelativeStrength; }

    static double return_score(double ret_pct, double neg_cap = -50.0, double pos_cap = 150.0);
    // z clipped to [-3, 3] then rescaled to [0, 100]
    static double zscore_score(double z);

protected:
    std::vector<std::string> required_features() const override;
    std::vector<std::string> availability_flags() const override;
    ComponentScore compute(const FeatureSet& features) const override;
};

// Contrarian: crowded longs (positive funding with open interest building)
// score low, crowded shorts score high.
class PositioningScorer : public ComponentScorer {
public:
    Component component() const override { return Component::Positioning; }

    static constexpr double kMaxAbsFunding = 0.003;

    static double funding_score(double funding_rate);
    static double crowding_score(double funding_rate, double oi_change_pct);

protected:
    std::vector<std::string> required_features() const override;
    std::vector<std::string> availability_flags() const override;
    ComponentScore compute(const FeatureSet& features) const override;
};

// The five scorers in canonical component order
std::array<std::unique_ptr<ComponentScorer>, kComponentCount> make_default_scorers();
