#ifndef SBM_ENGINE_METRICS_HPP
#define SBM_ENGINE_METRICS_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "alphabet.hpp"
#include <vector>

namespace sbm {

/**
 * Growth statistics shared by both run variants
 */
struct GrowthMetrics {
    size_t alpha_N = 0;                    // Alpha at the last processed index
    std::vector<Index> emergence_indices;  // Indices introducing a new signature
    size_t emergence_count = 0;
    Index last_emergence_n = 0;            // 0 if there is no emergence
    double E_N = 0.0;                      // emergence_count / N
    double Hs_N = 0.0;                     // ln(alpha_N + 1)
    double C_N = 0.0;                      // Hs_N / ln(N), 0 for N <= 1
    double mean_gap = 0.0;
    double var_gap = 0.0;                  // Population variance
};

/**
 * Alpha around the regime shift (state-stream runs)
 */
struct RegimeMarkers {
    size_t alpha_before_shift = 0;  // alpha(shift_n - 1), 0 if shift_n == 0
    size_t alpha_at_shift = 0;      // alpha(shift_n)
    size_t alpha_after = 0;         // alpha(N - 1)
};

/**
 * Accumulator of the stability / fracture scan over the first difference of alpha
 */
struct StabilityScan {
    size_t stable_run = 0;
    size_t max_stable_run = 0;
    int64_t max_spike = 0;
    Index spike_at_n = 0;
    size_t fracture_candidate_count = 0;
    Index fracture_first_at_n = 0;
};

/**
 * All metrics of a state-stream run
 */
struct FractureMetrics {
    GrowthMetrics growth;
    RegimeMarkers regime;
    StabilityScan stability;
};

struct GapStatistics {
    double mean_gap = 0.0;
    double var_gap = 0.0;
};

// Mean and population variance of consecutive emergence gaps
GapStatistics gap_statistics(const std::vector<Index>& emergence_indices);

GrowthMetrics compute_growth_metrics(const AlphaSeries& series, Index N);

RegimeMarkers compute_regime_markers(const AlphaSeries& series, Index shift_n, Index N);

/**
 * One step of the stability scan (pure)
 *
 * A zero diff extends the stable run. A nonzero diff may raise the spike
 * maximum, records a fracture candidate when the run before it reached
 * `long_stable_L`, and resets the run.
 */
StabilityScan scan_step(StabilityScan state, Index n, int64_t diff, Index long_stable_L);

// Fold scan_step over the series (alpha before the first index counts as 0)
StabilityScan scan_stability(const AlphaSeries& series, Index long_stable_L);

FractureMetrics compute_fracture_metrics(const AlphaSeries& series, const StreamConfig& config);

} // namespace sbm

#endif // SBM_ENGINE_METRICS_HPP
