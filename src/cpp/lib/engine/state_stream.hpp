#ifndef SBM_ENGINE_STATE_STREAM_HPP
#define SBM_ENGINE_STATE_STREAM_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include <vector>

namespace sbm {

/**
 * One deterministic step of the state sequence
 *
 * @param x Current state, in [0, M)
 * @param t Absolute step index (used by RAMP)
 * @param mode Step rule
 * @param a Multiplier (LCG only, any sign, reduced mod M)
 * @param c Increment (LCG only, any sign, reduced mod M)
 * @param M Modulus, >= 1
 * @return Next state, in [0, M)
 */
StateValue transition_step(StateValue x, Index t, TransitionMode mode,
                           int64_t a, int64_t c, uint64_t M);

/**
 * Non-negative residue of a signed value
 */
uint64_t floor_mod(int64_t value, uint64_t M);

/**
 * Two-regime state sequence
 *
 * Holds N + H + 1 states: N windows of H transitions each.
 * xs[0] = seed mod M; xs[t + 1] uses the pre regime while t < shift_n and
 * the post regime afterwards. Built once in the constructor, read-only after.
 */
class StateSequence {
public:
    // Throws ConfigError if the configuration is invalid
    explicit StateSequence(const StreamConfig& config);

    size_t size() const { return xs_.size(); }
    StateValue operator[](size_t t) const { return xs_[t]; }

private:
    std::vector<StateValue> xs_;
};

} // namespace sbm

#endif // SBM_ENGINE_STATE_STREAM_HPP
