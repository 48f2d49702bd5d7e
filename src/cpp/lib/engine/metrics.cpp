#include "metrics.hpp"
#include <cmath>

namespace sbm {

GapStatistics gap_statistics(const std::vector<Index>& emergence_indices) {
    GapStatistics stats;
    if (emergence_indices.size() < 2) {
        return stats;
    }

    std::vector<double> gaps;
    gaps.reserve(emergence_indices.size() - 1);
    for (size_t i = 0; i + 1 < emergence_indices.size(); ++i) {
        gaps.push_back(static_cast<double>(emergence_indices[i + 1] - emergence_indices[i]));
    }

    double sum = 0.0;
    for (double g : gaps) {
        sum += g;
    }
    stats.mean_gap = sum / static_cast<double>(gaps.size());

    if (gaps.size() > 1) {
        double sq = 0.0;
        for (double g : gaps) {
            sq += (g - stats.mean_gap) * (g - stats.mean_gap);
        }
        stats.var_gap = sq / static_cast<double>(gaps.size());
    }
    return stats;
}

GrowthMetrics compute_growth_metrics(const AlphaSeries& series, Index N) {
    GrowthMetrics m;
    m.alpha_N = series.empty() ? 0 : series.back().alpha;

    for (const auto& point : series) {
        if (point.is_new) {
            m.emergence_indices.push_back(point.index);
        }
    }
    m.emergence_count = m.emergence_indices.size();
    m.last_emergence_n = m.emergence_indices.empty() ? 0 : m.emergence_indices.back();

    m.E_N = N > 0 ? static_cast<double>(m.emergence_count) / static_cast<double>(N) : 0.0;
    m.Hs_N = std::log(static_cast<double>(m.alpha_N) + 1.0);
    m.C_N = N > 1 ? m.Hs_N / std::log(static_cast<double>(N)) : 0.0;

    GapStatistics gaps = gap_statistics(m.emergence_indices);
    m.mean_gap = gaps.mean_gap;
    m.var_gap = gaps.var_gap;
    return m;
}

RegimeMarkers compute_regime_markers(const AlphaSeries& series, Index shift_n, Index N) {
    RegimeMarkers markers;
    for (const auto& point : series) {
        if (shift_n > 0 && point.index == shift_n - 1) {
            markers.alpha_before_shift = point.alpha;
        }
        if (point.index == shift_n) {
            markers.alpha_at_shift = point.alpha;
        }
        if (N > 0 && point.index == N - 1) {
            markers.alpha_after = point.alpha;
        }
    }
    return markers;
}

StabilityScan scan_step(StabilityScan state, Index n, int64_t diff, Index long_stable_L) {
    if (diff == 0) {
        ++state.stable_run;
        if (state.stable_run > state.max_stable_run) {
            state.max_stable_run = state.stable_run;
        }
        return state;
    }

    if (diff > state.max_spike) {
        state.max_spike = diff;
        state.spike_at_n = n;
    }
    if (state.stable_run >= long_stable_L && diff >= 1) {
        ++state.fracture_candidate_count;
        if (state.fracture_first_at_n == 0) {
            state.fracture_first_at_n = n;
        }
    }
    state.stable_run = 0;
    return state;
}

StabilityScan scan_stability(const AlphaSeries& series, Index long_stable_L) {
    StabilityScan state;
    size_t prev = 0;
    for (const auto& point : series) {
        const int64_t diff = static_cast<int64_t>(point.alpha) - static_cast<int64_t>(prev);
        state = scan_step(state, point.index, diff, long_stable_L);
        prev = point.alpha;
    }
    return state;
}

FractureMetrics compute_fracture_metrics(const AlphaSeries& series, const StreamConfig& config) {
    config.validate();

    FractureMetrics m;
    m.growth = compute_growth_metrics(series, config.N);
    m.regime = compute_regime_markers(series, config.shift_n, config.N);
    m.stability = scan_stability(series, config.long_stable_L);
    return m;
}

} // namespace sbm
