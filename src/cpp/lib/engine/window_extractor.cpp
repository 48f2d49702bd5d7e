#include "window_extractor.hpp"
#include <bitset>
#include <stdexcept>

namespace sbm {

namespace {
    constexpr uint64_t MASK32 = 0xFFFFFFFFULL;
}

uint32_t observation_bit(StateValue x0, StateValue x1, ObservationMode obs, uint64_t M) {
    switch (obs) {
        case ObservationMode::DELTA_PARITY: {
            // Both states lie in [0, M), so this is the non-negative residue
            uint64_t delta = x1 >= x0 ? x1 - x0 : M - (x0 - x1);
            return static_cast<uint32_t>((delta % M) & 1U);
        }
        case ObservationMode::XOR_PARITY:
            return static_cast<uint32_t>(((x0 ^ x1) & MASK32) & 1U);
        case ObservationMode::X_LSB:
            return static_cast<uint32_t>(x0 & 1U);
        case ObservationMode::POPCNT_PARITY: {
            std::bitset<32> bits((x0 ^ x1) & MASK32);
            return static_cast<uint32_t>(bits.count() & 1U);
        }
    }
    throw ConfigError("Unknown observation mode");
}

Signature window_signature(const StateSequence& xs, Index n, Length H,
                           ObservationMode obs, uint64_t M) {
    if (n + H >= xs.size()) {
        throw std::out_of_range("Window " + std::to_string(n) + " of width " +
                                std::to_string(H) + " exceeds state sequence of length " +
                                std::to_string(xs.size()));
    }

    std::vector<uint32_t> bits;
    bits.reserve(H);
    for (Length k = 0; k < H; ++k) {
        bits.push_back(observation_bit(xs[n + k], xs[n + k + 1], obs, M));
    }
    return Signature(std::move(bits));
}

StreamSignatureSource::StreamSignatureSource(const StreamConfig& config)
    : config_(config), states_(config) {}

Signature StreamSignatureSource::signature_at(Index n) const {
    return window_signature(states_, n, config_.H, config_.obs, config_.M);
}

} // namespace sbm
