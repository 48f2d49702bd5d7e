#ifndef SBM_ENGINE_INDEX_OPERATORS_HPP
#define SBM_ENGINE_INDEX_OPERATORS_HPP

#include "../common.hpp"
#include "../config/run_config.hpp"
#include "signature.hpp"

namespace sbm {

/**
 * Index Operators
 *
 * Pure maps from an integer index n to a signature of width H:
 * - ssnt_closure:    (band of minimal divisor, hardness bucket)
 * - collatz_parity:  parity trace of the Collatz trajectory
 * - xorshift_parity: parity trace of a 13/17/5 xorshift32 orbit
 * - digitsum_mod9:   residues mod 9 under repeated decimal digit sums
 * - sha1_parity:     parity trace of iterated SHA-1 (first 4 bytes, big-endian)
 */

// Band letter for the prime-like case (no divisor below sqrt(n))
constexpr char PRIME_BAND = 'P';

// Epsilon subtracted before bucketing so exact bin edges round down
constexpr double BUCKET_EPSILON = 1e-12;

/**
 * Smallest divisor d of n with 2 <= d <= floor(sqrt(n)), by trial division.
 * Returns 0 when there is none (n prime) and for n <= 3.
 */
uint64_t min_divisor(uint64_t n);

/**
 * Band of a minimal divisor: P for 0, then A..E against t1..t4 (inclusive)
 */
char band_from_divisor(uint64_t d, const BandThresholds& bands);

/**
 * Bucket of x into k equal bins of [0, 1]
 *
 * x is clamped to [0, 1] first; x == 0 maps to 0, otherwise
 * floor((x - BUCKET_EPSILON) * k). k <= 1 always maps to 0.
 */
uint32_t bucket01(double x, Length k);

// Individual operators (n is the index, H the signature width)
Signature ssnt_closure_signature(uint64_t n, Length H, const BandThresholds& bands);
Signature collatz_parity_signature(uint64_t n, Length H);  // Throws std::overflow_error
Signature xorshift_parity_signature(uint64_t n, Length H);
Signature digitsum_mod9_signature(uint64_t n, Length H);
Signature sha1_parity_signature(uint64_t n, Length H);     // Throws std::runtime_error on digest failure

/**
 * Dispatch on the configured operator
 */
Signature operator_signature(uint64_t n, const OperatorConfig& config);

/**
 * Operator signatures over indices [2, N]
 */
class OperatorSignatureSource : public SignatureSource {
public:
    static constexpr Index FIRST_INDEX = 2;

    // Throws ConfigError on invalid configuration
    explicit OperatorSignatureSource(const OperatorConfig& config);

    Index first_index() const override { return FIRST_INDEX; }
    Index end_index() const override { return config_.N + 1; }
    Signature signature_at(Index n) const override;

private:
    const OperatorConfig config_;
};

} // namespace sbm

#endif // SBM_ENGINE_INDEX_OPERATORS_HPP
