#ifndef SBM_ENGINE_WINDOW_EXTRACTOR_HPP
#define SBM_ENGINE_WINDOW_EXTRACTOR_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "signature.hpp"
#include "state_stream.hpp"

namespace sbm {

/**
 * Observation bit for one state transition (x0 -> x1)
 *
 * - DELTA_PARITY:  low bit of (x1 - x0) mod M
 * - XOR_PARITY:    low bit of (x0 xor x1), 32-bit
 * - X_LSB:         low bit of x0
 * - POPCNT_PARITY: parity of popcount(x0 xor x1), 32-bit
 */
uint32_t observation_bit(StateValue x0, StateValue x1, ObservationMode obs, uint64_t M);

/**
 * Signature of window n: the H observation bits of
 * (xs[n+k], xs[n+k+1]) for k in [0, H)
 */
Signature window_signature(const StateSequence& xs, Index n, Length H,
                           ObservationMode obs, uint64_t M);

/**
 * Windowed signatures over a state sequence, indices [0, N)
 */
class StreamSignatureSource : public SignatureSource {
public:
    // Builds the state sequence; throws ConfigError on invalid configuration
    explicit StreamSignatureSource(const StreamConfig& config);

    Index first_index() const override { return 0; }
    Index end_index() const override { return config_.N; }
    Signature signature_at(Index n) const override;

private:
    const StreamConfig config_;
    const StateSequence states_;
};

} // namespace sbm

#endif // SBM_ENGINE_WINDOW_EXTRACTOR_HPP
