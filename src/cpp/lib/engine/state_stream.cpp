#include "state_stream.hpp"

namespace sbm {

namespace {
    // 128-bit intermediates keep a*x + c exact for any 64-bit modulus
    using Wide = unsigned __int128;
}

uint64_t floor_mod(int64_t value, uint64_t M) {
    if (value >= 0) {
        return static_cast<uint64_t>(value) % M;
    }
    // |value| as unsigned, without overflowing on INT64_MIN
    uint64_t magnitude = static_cast<uint64_t>(-(value + 1)) + 1;
    uint64_t r = magnitude % M;
    return r == 0 ? 0 : M - r;
}

StateValue transition_step(StateValue x, Index t, TransitionMode mode,
                           int64_t a, int64_t c, uint64_t M) {
    switch (mode) {
        case TransitionMode::LCG: {
            Wide next = static_cast<Wide>(floor_mod(a, M)) * x + floor_mod(c, M);
            return static_cast<StateValue>(next % M);
        }
        case TransitionMode::PLATEAU:
            return x;
        case TransitionMode::RAMP: {
            Wide next = static_cast<Wide>(x) + t + 1;
            return static_cast<StateValue>(next % M);
        }
    }
    throw ConfigError("Unknown transition mode");
}

StateSequence::StateSequence(const StreamConfig& config) {
    config.validate();

    const size_t total = static_cast<size_t>(config.N) + config.H + 1;
    xs_.resize(total);
    xs_[0] = floor_mod(config.seed, config.M);

    for (size_t t = 0; t + 1 < total; ++t) {
        if (t < config.shift_n) {
            xs_[t + 1] = transition_step(xs_[t], t, config.pre_mode, config.a1, config.c1, config.M);
        } else {
            xs_[t + 1] = transition_step(xs_[t], t, config.post_mode, config.a2, config.c2, config.M);
        }
    }
}

} // namespace sbm
