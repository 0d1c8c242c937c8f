#include "scorers.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

ComponentScore ComponentScorer::score(const FeatureSet& features) const {
    for (const auto& flag : availability_flags()) {
        auto value = features.get(flag);
        if (value && *value < 1.0) {
            return ComponentScore::unavailable(component());
        }
    }

    for (const auto& name : required_features()) {
        if (!features.get(name)) {
            return ComponentScore::unavailable(component());
        }
    }

    return compute(features);
}

// ---------------------------------------------------------------------------
// Trend

double TrendScorer::ma_alignment_score(double alignment) {
    return (clamp_value(alignment, -1.0, 1.0) + 1.0) * 50.0;
}

double TrendScorer::extension_score(double distance_pct, double ideal_band) {
    double dist = std::fabs(distance_pct);
    if (dist <= ideal_band) {
        return 100.0;
    }
    return clamp_value(100.0 - (dist - ideal_band) * 5.0, 0.0, 100.0);
}

double TrendScorer::slope_score(double slope_pct, double max_abs) {
    double s = clamp_value(slope_pct, -max_abs, max_abs);
    return (s + max_abs) / (2.0 * max_abs) * 100.0;
}

std::vector<std::string> TrendScorer::required_features() const {
    return {"ma_alignment", "trend_persistence", "distance_from_ma_pct", "ma_slope_pct"};
}

std::vector<std::string> TrendScorer::availability_flags() const {
    return {"has_trend_data"};
}

ComponentScore TrendScorer::compute(const FeatureSet& features) const {
    double s_align = ma_alignment_score(*features.get("ma_alignment"));
    double s_persist = clamp_value(*features.get("trend_persistence") * 100.0, 0.0, 100.0);
    double s_dist = extension_score(*features.get("distance_from_ma_pct"));
    double s_slope = slope_score(*features.get("ma_slope_pct"));

    double blended = 0.35 * s_align + 0.30 * s_persist + 0.20 * s_dist + 0.15 * s_slope;

    auto result = ComponentScore::make(component(), blended);
    result.details = {
        {"ma_align_score", s_align},
        {"trend_persistence_score", s_persist},
        {"distance_from_ma_score", s_dist},
        {"ma_slope_score", s_slope}
    };
    return result;
}

// ---------------------------------------------------------------------------
// Volume

double VolumeScorer::rvol_score(double rvol, double ideal_low, double ideal_high) {
    if (rvol <= 0.0) {
        return 0.0;
    }
    // Under 1x: low interest
    if (rvol < 1.0) {
        return clamp_value(rvol * 60.0, 0.0, 60.0);
    }
    if (rvol < ideal_low) {
        double t = (rvol - 1.0) / (ideal_low - 1.0);
        return 60.0 + t * 20.0;
    }
    if (rvol <= ideal_high) {
        double t = (rvol - ideal_low) / (ideal_high - ideal_low);
        return 80.0 + t * 20.0;
    }
    // Parabolic volume: decay from 100 toward 70 over the next 4x
    double extra = rvol - ideal_high;
    if (extra >= 4.0) {
        return 70.0;
    }
    return 100.0 - (extra / 4.0) * 30.0;
}

double VolumeScorer::trend_slope_score(double slope_pct, double max_abs) {
    double s = clamp_value(slope_pct, -max_abs, max_abs);
    return (s + max_abs) / (2.0 * max_abs) * 100.0;
}

std::vector<std::string> VolumeScorer::required_features() const {
    return {"volume_rvol_20_1", "volume_trend_slope_pct_20_10", "volume_percentile_60"};
}

std::vector<std::string> VolumeScorer::availability_flags() const {
    return {"has_volume_data"};
}

ComponentScore VolumeScorer::compute(const FeatureSet& features) const {
    double s_rvol = rvol_score(*features.get("volume_rvol_20_1"));
    double s_slope = trend_slope_score(*features.get("volume_trend_slope_pct_20_10"));
    double s_pct = clamp_value(*features.get("volume_percentile_60") * 100.0, 0.0, 100.0);

    double blended = 0.45 * s_rvol + 0.25 * s_slope + 0.30 * s_pct;

    auto result = ComponentScore::make(component(), blended);
    result.details = {
        {"volume_rvol_score", s_rvol},
        {"volume_trend_slope_score", s_slope},
        {"volume_percentile_score", s_pct}
    };
    return result;
}

// ---------------------------------------------------------------------------
// Volatility

double VolatilityScorer::inverse_scale_score(double x, double scale) {
    if (x < 0.0) {
        x = 0.0;
    }
    return clamp_value(100.0 / (1.0 + x / scale), 0.0, 100.0);
}

double VolatilityScorer::contraction_ratio_score(double ratio) {
    // recent ATR% / earlier ATR%: 0 -> 100, 2+ -> 0
    if (ratio <= 0.0) {
        return 100.0;
    }
    if (ratio >= 2.0) {
        return 0.0;
    }
    return (2.0 - ratio) / 2.0 * 100.0;
}

std::vector<std::string> VolatilityScorer::required_features() const {
    return {"volatility_atr_pct_14", "volatility_bb_width_pct_20", "volatility_contraction_ratio_60_20"};
}

std::vector<std::string> VolatilityScorer::availability_flags() const {
    return {"has_volatility_data"};
}

ComponentScore VolatilityScorer::compute(const FeatureSet& features) const {
    double s_atr = inverse_scale_score(*features.get("volatility_atr_pct_14"), 5.0);
    double s_bb = inverse_scale_score(*features.get("volatility_bb_width_pct_20"), 10.0);
    double s_contr = contraction_ratio_score(*features.get("volatility_contraction_ratio_60_20"));

    double blended = 0.30 * s_atr + 0.35 * s_bb + 0.35 * s_contr;

    auto result = ComponentScore::make(component(), blended);
    result.details = {
        {"volatility_atr_score", s_atr},
        {"volatility_bb_width_score", s_bb},
        {"volatility_contraction_ratio_score", s_contr}
    };
    return result;
}

// ---------------------------------------------------------------------------
// Relative strength

double RelativeStrengthScorer::return_score(double ret_pct, double neg_cap, double pos_cap) {
    if (ret_pct <= neg_cap) {
        return 0.0;
    }
    if (ret_pct >= pos_cap) {
        return 100.0;
    }
    return (ret_pct - neg_cap) / (pos_cap - neg_cap) * 100.0;
}

double RelativeStrengthScorer::zscore_score(double z) {
    return (clamp_value(z, -3.0, 3.0) + 3.0) / 6.0 * 100.0;
}

std::vector<std::string> RelativeStrengthScorer::required_features() const {
    return {"rs_ret_20_pct", "rs_ret_60_pct", "rs_ret_120_pct"};
}

std::vector<std::string> RelativeStrengthScorer::availability_flags() const {
    return {"has_rs_data"};
}

ComponentScore RelativeStrengthScorer::compute(const FeatureSet& features) const {
    double s_20 = return_score(*features.get("rs_ret_20_pct"));
    double s_60 = return_score(*features.get("rs_ret_60_pct"));
    double s_120 = return_score(*features.get("rs_ret_120_pct"));

    // More emphasis on the 3M / 6M windows
    double blended = 0.25 * s_20 + 0.35 * s_60 + 0.40 * s_120;

    auto result = ComponentScore::make(component(), blended);
    result.details = {
        {"rs_ret_20_score", s_20},
        {"rs_ret_60_score", s_60},
        {"rs_ret_120_score", s_120}
    };

    // Cross-sectional z-score against the universe, when the extractor has one
    auto z = features.get("rs_zscore");
    if (z) {
        double s_z = zscore_score(*z);
        result = ComponentScore::make(component(), 0.5 * blended + 0.5 * s_z);
        result.details = {
            {"rs_ret_20_score", s_20},
            {"rs_ret_60_score", s_60},
            {"rs_ret_120_score", s_120},
            {"rs_zscore_score", s_z}
        };
    }
    return result;
}

// ---------------------------------------------------------------------------
// Positioning

double PositioningScorer::funding_score(double funding_rate) {
    double normalized = clamp_value(funding_rate, -kMaxAbsFunding, kMaxAbsFunding) / kMaxAbsFunding;
    // Inverted on purpose: expensive longs -> 10, expensive shorts -> 90
    return 50.0 - normalized * 40.0;
}

double PositioningScorer::crowding_score(double funding_rate, double oi_change_pct) {
    double normalized = clamp_value(funding_rate, -kMaxAbsFunding, kMaxAbsFunding) / kMaxAbsFunding;
    // Only open interest that is building amplifies the crowded side;
    // unwinding positions read as neutral.
    double build_up = std::max(0.0, clamp_value(oi_change_pct, -100.0, 100.0) / 100.0);
    return 50.0 - 50.0 * normalized * build_up;
}

std::vector<std::string> PositioningScorer::required_features() const {
    return {"positioning_funding_rate", "positioning_oi_change_pct"};
}

std::vector<std::string> PositioningScorer::availability_flags() const {
    return {"has_positioning_data"};
}

ComponentScore PositioningScorer::compute(const FeatureSet& features) const {
    double funding = *features.get("positioning_funding_rate");
    double oi_change = *features.get("positioning_oi_change_pct");

    double s_funding = funding_score(funding);
    double s_crowding = crowding_score(funding, oi_change);

    double blended = 0.7 * s_funding + 0.3 * s_crowding;

    auto result = ComponentScore::make(component(), blended);
    result.details = {
        {"positioning_funding_score", s_funding},
        {"positioning_crowding_score", s_crowding}
    };
    return result;
}

std::array<std::unique_ptr<ComponentScorer>, kComponentCount> make_default_scorers() {
    return {
        std::make_unique<TrendScorer>(),
        std::make_unique<VolumeScorer>(),
        std::make_unique<VolatilityScorer>(),
        std::make_unique<RelativeStrengthScorer>(),
        std::make_unique<PositioningScorer>()
    };
}
