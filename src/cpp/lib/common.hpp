#ifndef SBM_COMMON_HPP
#define SBM_COMMON_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <filesystem>

namespace sbm {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr const char* SBM_PROFILE_VERSION = "2.0";     // Index-operator profile schema
constexpr const char* SBM_AI_PROFILE_VERSION = "1.2";  // State-stream profile schema

// Common types
using Index = uint64_t;     // Position in the sweep (n)
using Length = uint32_t;    // Signature width (H)
using StateValue = uint64_t;

// Artifact names (index-operator runs)
constexpr const char* SBM_RESULTS_CSV = "sbm_results.csv";
constexpr const char* SBM_ALPHABET_CSV = "sbm_alphabet.csv";
constexpr const char* SBM_METRICS_CSV = "sbm_metrics.csv";
constexpr const char* SBM_PROFILE_JSON = "sbm_profile.json";
constexpr const char* SBM_MANIFEST = "sbm_manifest.sha256";

// Artifact names (state-stream runs)
constexpr const char* SBM_AI_RESULTS_CSV = "sbm_ai_results.csv";
constexpr const char* SBM_AI_ALPHABET_CSV = "sbm_ai_alphabet.csv";
constexpr const char* SBM_AI_METRICS_CSV = "sbm_ai_metrics.csv";
constexpr const char* SBM_AI_PROFILE_JSON = "sbm_ai_profile.json";
constexpr const char* SBM_AI_MANIFEST = "sbm_ai_manifest.sha256";

// Error codes (also the exit status of verify_sbm)
enum class ErrorCode {
    SUCCESS = 0,
    VERIFY_FAILED = 1,
    OUTPUTS_NOT_FOUND = 2,
    REPORT_WRITE_FAILED = 3
};

/**
 * Fixed 12-decimal rendering used by every metrics artifact ("%.12f")
 */
std::string format_fixed12(double value);

/**
 * Shortest round-trip rendering of a double in the conventional
 * "repr" layout: fixed notation for decimal exponents in [-4, 15],
 * scientific ("1e-05", "1.5e+16") otherwise, and a trailing ".0" on
 * integral values.
 */
std::string format_shortest(double value);

/**
 * Value of format_fixed12(value) read back as a double
 */
double round_fixed12(double value);

/**
 * Pick a fresh output directory: `base` if it does not exist or is an empty
 * directory, otherwise the first free `base_R1`, `base_R2`, ...
 * Throws std::runtime_error if `base` exists and is not a directory.
 */
std::filesystem::path ensure_unique_outdir(const std::filesystem::path& base);

/**
 * High-resolution timer for performance measurements
 */
class Timer {
public:
    Timer();
    ~Timer();

    void start();
    void stop();
    double elapsed_seconds() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Get current process peak memory usage in MB
 * Returns 0.0 if unavailable (non-Linux platform or error reading /proc)
 */
double get_peak_memory_mb();

} // namespace sbm

#endif // SBM_COMMON_HPP
