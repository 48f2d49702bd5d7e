#ifndef SBM_FORMATS_BUNDLE_VERIFIER_HPP
#define SBM_FORMATS_BUNDLE_VERIFIER_HPP

#include "../common.hpp"
#include "manifest.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sbm {

/**
 * Reproducibility checks over artifact bundles
 *
 * A bundle is one run's output directory. It passes when all required
 * files exist, its manifest parses, every listed file hashes to its
 * digest, and every required artifact is listed. Two runs of the same
 * configuration ("primary" and "replay") must carry byte-identical manifests.
 */

struct BundleSpec {
    std::vector<std::string> required_files;
    std::vector<std::string> required_manifest_entries;
    std::string manifest_name;
};

// The state-stream bundle layout
BundleSpec stream_bundle_spec();

struct BundleResult {
    std::filesystem::path folder;
    bool ok = false;
    std::vector<std::string> missing_files;
    bool manifest_ok = false;
    std::vector<std::string> manifest_errors;
};

BundleResult verify_bundle(const std::filesystem::path& folder, const BundleSpec& spec);

/**
 * Byte comparison of the two bundles' manifests
 * @return (identical, reason)
 */
std::pair<bool, std::string> compare_manifests(const std::filesystem::path& primary,
                                               const std::filesystem::path& replay,
                                               const std::string& manifest_name);

/**
 * Operator registry: blank-line separated blocks, the first line naming the
 * operator, further "key: value" lines (keys lower-cased).
 * Each block maps "operator" to its name. Missing file -> empty list.
 */
using RegistryEntry = std::map<std::string, std::string>;
std::vector<RegistryEntry> parse_operator_registry(const std::filesystem::path& registry_path);

// Multi-line human readable bundle summary
std::string format_bundle(const BundleResult& result);

struct VerifierOptions {
    std::filesystem::path outputs_dir;
    bool use_registry = false;
    bool phasec_only = false;   // Registry mode: only AI_FRACTURE operators
};

struct VerifierReport {
    std::vector<std::string> lines;
    bool overall_ok = false;
    bool outputs_found = false;

    std::string text() const;
};

/**
 * Verify every bundle under the outputs directory
 *
 * Registry mode (a registry file exists and use_registry is set): check the
 * primary and replay folders named by each operator block, relative to the
 * parent of the outputs directory, and compare their manifests.
 * Otherwise: check every direct subdirectory that holds a stream manifest.
 */
VerifierReport run_verifier(const VerifierOptions& options);

} // namespace sbm

#endif // SBM_FORMATS_BUNDLE_VERIFIER_HPP
