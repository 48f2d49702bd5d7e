#ifndef SBM_CONFIG_RUN_CONFIG_HPP
#define SBM_CONFIG_RUN_CONFIG_HPP

#include "../common.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace sbm {

/**
 * Raised for any malformed run configuration (unknown tag, value out of range).
 * Always thrown before the first state or signature is produced.
 */
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// State-sequence step rule
enum class TransitionMode {
    LCG,      // x' = (a*x + c) mod M
    PLATEAU,  // x' = x
    RAMP      // x' = (x + t + 1) mod M
};

// Per-pair observation bit of the windowed extractor
enum class ObservationMode {
    DELTA_PARITY,
    XOR_PARITY,
    X_LSB,
    POPCNT_PARITY
};

// Index operators
enum class OperatorKind {
    SSNT_CLOSURE,
    COLLATZ_PARITY,
    XORSHIFT_PARITY,
    DIGITSUM_MOD9,
    SHA1_PARITY
};

// Tag <-> name conversions (parse_* throw ConfigError on unknown names)
TransitionMode parse_transition_mode(const std::string& name);
ObservationMode parse_observation_mode(const std::string& name);
OperatorKind parse_operator_kind(const std::string& name);

std::string to_string(TransitionMode mode);
std::string to_string(ObservationMode mode);
std::string to_string(OperatorKind op);

// Accepted names, in declaration order (for help texts)
std::vector<std::string> transition_mode_names();
std::vector<std::string> observation_mode_names();
std::vector<std::string> operator_kind_names();

/**
 * State-sequence run configuration
 *
 * Plain aggregate: fill it once, call validate(), then only pass it by
 * const reference. Every engine entry point validates again.
 */
struct StreamConfig {
    Index N = 0;                // Number of windows (sweep covers [0, N))
    Length H = 0;               // Window width (transitions per signature)
    uint64_t M = 0;             // Modulus of the state space
    int64_t seed = 0;
    int64_t a1 = 0;             // Pre-shift LCG parameters
    int64_t c1 = 0;
    int64_t a2 = 0;             // Post-shift LCG parameters
    int64_t c2 = 0;
    Index shift_n = 0;          // First step using the post regime
    Index long_stable_L = 0;    // Stable-run length that qualifies a fracture
    ObservationMode obs = ObservationMode::XOR_PARITY;
    TransitionMode pre_mode = TransitionMode::LCG;
    TransitionMode post_mode = TransitionMode::LCG;

    // Throws ConfigError
    void validate() const;
};

/**
 * Ascending divisor thresholds separating bands A < B < C < D < E
 */
struct BandThresholds {
    uint64_t t1 = 3;
    uint64_t t2 = 11;
    uint64_t t3 = 31;
    uint64_t t4 = 101;
};

/**
 * Index-operator run configuration (sweep covers [2, N])
 */
struct OperatorConfig {
    OperatorKind op = OperatorKind::SSNT_CLOSURE;
    Index N = 0;
    Length H = 0;
    BandThresholds bands;

    // Throws ConfigError
    void validate() const;
};

/**
 * Resolve a requested regime-shift index: negative means "N / 2".
 * The result is clamped to [0, N - 1].
 */
Index resolve_shift_n(int64_t requested, Index N);

} // namespace sbm

#endif // SBM_CONFIG_RUN_CONFIG_HPP
