// State stream tests - transitions, regime switch, observation bits and windows
#include "engine/state_stream.hpp"
#include "engine/window_extractor.hpp"
#include "config/run_config.hpp"
#include <iostream>
#include <cassert>
#include <cstdint>
#include <vector>

using namespace sbm;

// N=5, H=1, M=8, seed=0, ramp throughout, delta parity
StreamConfig ramp_config() {
    StreamConfig config;
    config.N = 5;
    config.H = 1;
    config.M = 8;
    config.seed = 0;
    config.a1 = 0;
    config.c1 = 0;
    config.a2 = 0;
    config.c2 = 0;
    config.shift_n = 5;
    config.long_stable_L = 2000;
    config.obs = ObservationMode::DELTA_PARITY;
    config.pre_mode = TransitionMode::RAMP;
    config.post_mode = TransitionMode::RAMP;
    return config;
}

template <typename F>
bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void test_floor_mod() {
    std::cout << "Test 1: Non-negative residues... ";

    assert(floor_mod(7, 8) == 7);
    assert(floor_mod(8, 8) == 0);
    assert(floor_mod(-1, 8) == 7);
    assert(floor_mod(-8, 8) == 0);
    assert(floor_mod(-9, 8) == 7);
    assert(floor_mod(INT64_MIN, 2) == 0);
    assert(floor_mod(123, 1) == 0);

    std::cout << "PASSED\n";
}

void test_transition_modes() {
    std::cout << "Test 2: Transition modes... ";

    // LCG: (a*x + c) mod M
    assert(transition_step(3, 0, TransitionMode::LCG, 5, 1, 16) == 0);   // 16 mod 16
    assert(transition_step(2, 9, TransitionMode::LCG, 3, 4, 100) == 10);
    // Negative parameters are reduced first
    assert(transition_step(2, 0, TransitionMode::LCG, -1, 0, 10) == 8);

    // No overflow for a full 64-bit product
    uint64_t M = 0xFFFFFFFFFFFFFFC5ULL;                  // Largest 64-bit prime
    StateValue x = M - 1;                                // x = -1 mod M
    assert(transition_step(x, 0, TransitionMode::LCG, 2, 0, M) == M - 2);

    // Plateau keeps the state, ramp adds t + 1
    assert(transition_step(6, 3, TransitionMode::PLATEAU, 99, 99, 8) == 6);
    assert(transition_step(6, 3, TransitionMode::RAMP, 0, 0, 8) == 2);

    std::cout << "PASSED\n";
}

void test_ramp_sequence() {
    std::cout << "Test 3: Ramp state sequence... ";

    StateSequence xs(ramp_config());
    assert(xs.size() == 7);  // N + H + 1

    const std::vector<StateValue> expected = {0, 1, 3, 6, 2, 7, 5};
    for (size_t i = 0; i < expected.size(); ++i) {
        assert(xs[i] == expected[i]);
    }

    std::cout << "PASSED\n";
}

void test_regime_switch() {
    std::cout << "Test 4: Regime switch at shift_n... ";

    // Plateau before step 3, ramp from step 3 on
    StreamConfig config = ramp_config();
    config.N = 6;
    config.H = 2;
    config.M = 16;
    config.seed = 3;
    config.shift_n = 3;
    config.pre_mode = TransitionMode::PLATEAU;
    config.post_mode = TransitionMode::RAMP;

    StateSequence xs(config);
    const std::vector<StateValue> expected = {3, 3, 3, 3, 7, 12, 2, 9, 1};
    assert(xs.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        assert(xs[i] == expected[i]);
    }

    // shift_n = 0 runs the post regime from the first step
    config.shift_n = 0;
    StateSequence all_post(config);
    assert(all_post[1] == 4);  // 3 + 0 + 1

    std::cout << "PASSED\n";
}

void test_negative_seed() {
    std::cout << "Test 5: Negative seed is reduced modulo M... ";

    StreamConfig config = ramp_config();
    config.seed = -3;
    StateSequence xs(config);
    assert(xs[0] == 5);
    assert(xs[1] == 6);

    std::cout << "PASSED\n";
}

void test_observation_bits() {
    std::cout << "Test 6: Observation functions... ";

    // delta parity uses the non-negative residue of x1 - x0
    assert(observation_bit(6, 2, ObservationMode::DELTA_PARITY, 8) == 0);  // 4
    assert(observation_bit(2, 7, ObservationMode::DELTA_PARITY, 8) == 1);  // 5
    assert(observation_bit(7, 2, ObservationMode::DELTA_PARITY, 9) == 0);  // 4

    assert(observation_bit(5, 6, ObservationMode::XOR_PARITY, 16) == 1);   // 5 ^ 6 = 3
    assert(observation_bit(5, 7, ObservationMode::XOR_PARITY, 16) == 0);   // 2

    assert(observation_bit(5, 0, ObservationMode::X_LSB, 16) == 1);
    assert(observation_bit(4, 1, ObservationMode::X_LSB, 16) == 0);

    assert(observation_bit(0, 7, ObservationMode::POPCNT_PARITY, 16) == 1);  // 3 bits
    assert(observation_bit(0, 3, ObservationMode::POPCNT_PARITY, 16) == 0);  // 2 bits
    // Only the low 32 bits count
    assert(observation_bit(0, 0x100000000ULL, ObservationMode::POPCNT_PARITY, 0x200000000ULL) == 0);

    std::cout << "PASSED\n";
}

void test_window_signatures() {
    std::cout << "Test 7: Window signatures of the ramp stream... ";

    StreamSignatureSource source(ramp_config());
    assert(source.first_index() == 0);
    assert(source.end_index() == 5);
    assert(source.count() == 5);

    const std::vector<uint32_t> expected = {1, 0, 1, 0, 1};
    for (Index n = 0; n < 5; ++n) {
        Signature sig = source.signature_at(n);
        assert(sig.width() == 1);
        assert(sig.symbols[0] == expected[n]);
    }
    assert(source.signature_at(0).to_string() == "(1,)");

    StateSequence xs(ramp_config());
    bool threw = false;
    try {
        window_signature(xs, 6, 1, ObservationMode::DELTA_PARITY, 8);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_config_validation() {
    std::cout << "Test 8: Invalid stream configurations are rejected... ";

    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.N = 0; c.validate(); }));
    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.H = 0; c.validate(); }));
    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.M = 0; c.validate(); }));
    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.shift_n = 6; c.validate(); }));
    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.long_stable_L = 0; c.validate(); }));
    assert(throws_config_error([] { StreamConfig c = ramp_config(); c.N = 0; StateSequence xs(c); }));

    // M = 1 is legal: every state is 0
    StreamConfig c = ramp_config();
    c.M = 1;
    StateSequence xs(c);
    for (size_t i = 0; i < xs.size(); ++i) {
        assert(xs[i] == 0);
    }

    std::cout << "PASSED\n";
}

void test_mode_names() {
    std::cout << "Test 9: Mode names parse and print... ";

    assert(parse_transition_mode("plateau") == TransitionMode::PLATEAU);
    assert(to_string(TransitionMode::RAMP) == "ramp");
    assert(parse_observation_mode("popcnt_parity") == ObservationMode::POPCNT_PARITY);
    assert(to_string(ObservationMode::X_LSB) == "x_lsb");
    assert(transition_mode_names().size() == 3);
    assert(observation_mode_names().size() == 4);

    assert(throws_config_error([] { parse_transition_mode("LCG"); }));
    assert(throws_config_error([] { parse_observation_mode("parity"); }));

    std::cout << "PASSED\n";
}

void test_resolve_shift() {
    std::cout << "Test 10: Shift index resolution... ";

    assert(resolve_shift_n(-1, 10) == 5);
    assert(resolve_shift_n(-1, 7) == 3);
    assert(resolve_shift_n(4, 10) == 4);
    assert(resolve_shift_n(10, 10) == 9);   // Clamped to N - 1
    assert(resolve_shift_n(500, 10) == 9);
    assert(resolve_shift_n(0, 10) == 0);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "===========================================\n";
    std::cout << "Running State Stream Tests\n";
    std::cout << "===========================================\n\n";

    try {
        test_floor_mod();
        test_transition_modes();
        test_ramp_sequence();
        test_regime_switch();
        test_negative_seed();
        test_observation_bits();
        test_window_signatures();
        test_config_validation();
        test_mode_names();
        test_resolve_shift();

        std::cout << "\n===========================================\n";
        std::cout << "All state stream tests PASSED!\n";
        std::cout << "===========================================\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
