// Metrics tests - growth statistics, regime markers and the fracture scan
#include "engine/metrics.hpp"
#include "engine/alphabet.hpp"
#include "engine/window_extractor.hpp"
#include "config/run_config.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>

using namespace sbm;

bool near(double a, double b) {
    return std::abs(a - b) < 1e-12;
}

// Alpha series from a list of alpha values at consecutive indices
AlphaSeries series_of(Index first, const std::vector<size_t>& alphas) {
    AlphaSeries series;
    size_t prev = 0;
    for (size_t i = 0; i < alphas.size(); ++i) {
        series.push_back(AlphaPoint{first + i, alphas[i], alphas[i] > prev});
        prev = alphas[i];
    }
    return series;
}

StreamConfig ramp_config() {
    StreamConfig config;
    config.N = 5;
    config.H = 1;
    config.M = 8;
    config.seed = 0;
    config.shift_n = 5;
    config.long_stable_L = 2000;
    config.obs = ObservationMode::DELTA_PARITY;
    config.pre_mode = TransitionMode::RAMP;
    config.post_mode = TransitionMode::RAMP;
    return config;
}

void test_ramp_growth() {
    std::cout << "Test 1: Growth metrics of the ramp stream... ";

    StreamConfig config = ramp_config();
    StreamSignatureSource source(config);
    AlphabetTracker tracker;
    run_sweep(source, tracker);

    GrowthMetrics m = compute_growth_metrics(tracker.series(), config.N);
    assert(m.alpha_N == 2);
    assert(m.emergence_count == 2);
    assert((m.emergence_indices == std::vector<Index>{0, 1}));
    assert(m.last_emergence_n == 1);
    assert(near(m.E_N, 0.4));
    assert(near(m.Hs_N, std::log(3.0)));
    assert(near(m.C_N, std::log(3.0) / std::log(5.0)));
    assert(near(m.mean_gap, 1.0));
    assert(near(m.var_gap, 0.0));

    std::cout << "PASSED\n";
}

void test_growth_guards() {
    std::cout << "Test 2: Degenerate growth inputs... ";

    // N = 1: C_N is defined as 0
    GrowthMetrics one = compute_growth_metrics(series_of(0, {1}), 1);
    assert(one.alpha_N == 1);
    assert(near(one.E_N, 1.0));
    assert(near(one.C_N, 0.0));
    assert(near(one.mean_gap, 0.0) && near(one.var_gap, 0.0));

    // Empty series
    GrowthMetrics none = compute_growth_metrics(AlphaSeries{}, 1);
    assert(none.alpha_N == 0);
    assert(none.emergence_count == 0);
    assert(none.last_emergence_n == 0);
    assert(near(none.Hs_N, 0.0));

    // Gaps 3, 1: mean 2, population variance 1
    GapStatistics g = gap_statistics({0, 3, 4});
    assert(near(g.mean_gap, 2.0));
    assert(near(g.var_gap, 1.0));

    // A single gap has zero variance
    g = gap_statistics({2, 9});
    assert(near(g.mean_gap, 7.0));
    assert(near(g.var_gap, 0.0));

    std::cout << "PASSED\n";
}

void test_regime_markers() {
    std::cout << "Test 3: Alpha around the shift... ";

    AlphaSeries series = series_of(0, {1, 1, 1, 2, 3, 3});

    RegimeMarkers r = compute_regime_markers(series, 3, 6);
    assert(r.alpha_before_shift == 1);
    assert(r.alpha_at_shift == 2);
    assert(r.alpha_after == 3);

    r = compute_regime_markers(series, 0, 6);
    assert(r.alpha_before_shift == 0);
    assert(r.alpha_at_shift == 1);

    std::cout << "PASSED\n";
}

void test_single_fracture() {
    std::cout << "Test 4: A long stable run followed by growth is one fracture... ";

    // diffs: +1, 0, 0, 0, +1
    AlphaSeries series = series_of(0, {1, 1, 1, 1, 2});
    StabilityScan s = scan_stability(series, 3);
    assert(s.max_stable_run == 3);
    assert(s.fracture_candidate_count == 1);
    assert(s.fracture_first_at_n == 4);
    assert(s.max_spike == 1);
    assert(s.spike_at_n == 0);
    assert(s.stable_run == 0);

    // One step short of L: no fracture
    s = scan_stability(series, 4);
    assert(s.fracture_candidate_count == 0);
    assert(s.fracture_first_at_n == 0);

    std::cout << "PASSED\n";
}

void test_scan_step() {
    std::cout << "Test 5: Stability scan step function... ";

    StabilityScan s;
    s = scan_step(s, 10, 0, 2);
    s = scan_step(s, 11, 0, 2);
    assert(s.stable_run == 2 && s.max_stable_run == 2);

    s = scan_step(s, 12, 1, 2);
    assert(s.stable_run == 0);
    assert(s.fracture_candidate_count == 1 && s.fracture_first_at_n == 12);

    s = scan_step(s, 13, 0, 2);
    s = scan_step(s, 14, 0, 2);
    s = scan_step(s, 15, 0, 2);
    s = scan_step(s, 16, 1, 2);
    assert(s.fracture_candidate_count == 2);
    assert(s.fracture_first_at_n == 12);
    assert(s.max_stable_run == 3);

    // The input state is not modified
    StabilityScan before = s;
    StabilityScan after = scan_step(before, 17, 0, 2);
    assert(before.stable_run == 0);
    assert(after.stable_run == 1);

    std::cout << "PASSED\n";
}

void test_fracture_metrics() {
    std::cout << "Test 6: Combined fracture metrics... ";

    StreamConfig config = ramp_config();
    config.N = 6;
    config.H = 2;
    config.M = 16;
    config.seed = 3;
    config.shift_n = 3;
    config.long_stable_L = 2;
    config.pre_mode = TransitionMode::PLATEAU;

    StreamSignatureSource source(config);
    AlphabetTracker tracker;
    run_sweep(source, tracker);

    FractureMetrics m = compute_fracture_metrics(tracker.series(), config);
    assert(m.growth.alpha_N == 3);
    assert((m.growth.emergence_indices == std::vector<Index>{0, 3, 4}));
    assert(near(m.growth.E_N, 0.5));
    assert(near(m.growth.C_N, std::log(4.0) / std::log(6.0)));
    assert(m.regime.alpha_before_shift == 1);
    assert(m.regime.alpha_at_shift == 2);
    assert(m.regime.alpha_after == 3);
    assert(m.stability.max_stable_run == 2);
    assert(m.stability.fracture_candidate_count == 1);
    assert(m.stability.fracture_first_at_n == 3);

    bool threw = false;
    try {
        config.long_stable_L = 0;
        compute_fracture_metrics(tracker.series(), config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "===========================================\n";
    std::cout << "Running Metrics Tests\n";
    std::cout << "===========================================\n\n";

    try {
        test_ramp_growth();
        test_growth_guards();
        test_regime_markers();
        test_single_fracture();
        test_scan_step();
        test_fracture_metrics();

        std::cout << "\n===========================================\n";
        std::cout << "All metrics tests PASSED!\n";
        std::cout << "===========================================\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
