#include "bundle_verifier.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace sbm {

namespace fs = std::filesystem;

namespace {
    constexpr const char* REGISTRY_PHASEC = "OPERATOR_REGISTRY_PHASEC.txt";
    constexpr const char* REGISTRY_DEFAULT = "OPERATOR_REGISTRY.txt";
    constexpr const char* REGISTRY_HEADER = "SBM OPERATOR REGISTRY";
    constexpr const char* FRACTURE_TAG = "AI_FRACTURE";

    std::string trim(const std::string& s) {
        size_t begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

    bool read_file(const fs::path& path, std::string& out) {
        std::ifstream ifs(path, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            return false;
        }
        std::ostringstream oss;
        oss << ifs.rdbuf();
        out = oss.str();
        return !ifs.bad();
    }

    fs::path resolve(const fs::path& p) {
        std::error_code ec;
        fs::path resolved = fs::weakly_canonical(fs::absolute(p), ec);
        return ec ? fs::absolute(p) : resolved;
    }

    std::string lookup(const RegistryEntry& entry, const std::string& key) {
        auto it = entry.find(key);
        return it == entry.end() ? "" : it->second;
    }
}

BundleSpec stream_bundle_spec() {
    BundleSpec spec;
    spec.required_files = {
        SBM_AI_RESULTS_CSV, SBM_AI_ALPHABET_CSV, SBM_AI_METRICS_CSV,
        SBM_AI_PROFILE_JSON, SBM_AI_MANIFEST,
    };
    spec.required_manifest_entries = {
        SBM_AI_RESULTS_CSV, SBM_AI_ALPHABET_CSV, SBM_AI_METRICS_CSV, SBM_AI_PROFILE_JSON,
    };
    spec.manifest_name = SBM_AI_MANIFEST;
    return spec;
}

BundleResult verify_bundle(const fs::path& folder, const BundleSpec& spec) {
    BundleResult result;
    result.folder = folder;

    for (const auto& name : spec.required_files) {
        if (!fs::is_regular_file(folder / name)) {
            result.missing_files.push_back(name);
        }
    }
    if (!result.missing_files.empty()) {
        result.manifest_errors.push_back("missing_required_files");
        return result;
    }

    std::string manifest_text;
    if (!read_file(folder / spec.manifest_name, manifest_text)) {
        result.manifest_errors.push_back("manifest_read_error: " + (folder / spec.manifest_name).string());
        return result;
    }

    std::vector<ManifestEntry> entries = parse_manifest_lines(manifest_text);
    if (entries.empty()) {
        result.manifest_errors.push_back("manifest_parse_failed_or_empty");
        return result;
    }

    std::vector<std::string> seen;
    for (const auto& entry : entries) {
        seen.push_back(entry.name);
        fs::path file_path = folder / entry.name;
        if (!fs::is_regular_file(file_path)) {
            result.manifest_errors.push_back("manifest_lists_missing_file: " + entry.name);
            continue;
        }
        std::string actual;
        try {
            actual = sha256_file(file_path);
        } catch (const std::exception& e) {
            result.manifest_errors.push_back("hash_read_error: " + entry.name + ": " + e.what());
            continue;
        }
        if (actual != entry.digest) {
            result.manifest_errors.push_back("hash_mismatch: " + entry.name + ": manifest=" +
                                             entry.digest + " actual=" + actual);
        }
    }

    for (const auto& name : spec.required_manifest_entries) {
        if (std::find(seen.begin(), seen.end(), name) == seen.end()) {
            result.manifest_errors.push_back("manifest_missing_required_entry: " + name);
        }
    }

    result.manifest_ok = result.manifest_errors.empty();
    result.ok = result.manifest_ok;
    return result;
}

std::pair<bool, std::string> compare_manifests(const fs::path& primary,
                                               const fs::path& replay,
                                               const std::string& manifest_name) {
    std::string p_text;
    std::string r_text;
    if (!fs::is_regular_file(primary / manifest_name) || !fs::is_regular_file(replay / manifest_name) ||
        !read_file(primary / manifest_name, p_text) || !read_file(replay / manifest_name, r_text)) {
        return {false, "missing_manifest_in_primary_or_replay"};
    }
    if (p_text == r_text) {
        return {true, "manifest_byte_identical"};
    }
    return {false, "manifest_not_identical"};
}

std::vector<RegistryEntry> parse_operator_registry(const fs::path& registry_path) {
    std::vector<RegistryEntry> ops;
    std::string text;
    if (!fs::is_regular_file(registry_path) || !read_file(registry_path, text)) {
        return ops;
    }

    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            if (!current.empty()) {
                blocks.push_back(current);
                current.clear();
            }
            continue;
        }
        if (trim(line).rfind(REGISTRY_HEADER, 0) == 0) {
            continue;
        }
        size_t end = line.find_last_not_of(" \t\r\n");
        current.push_back(line.substr(0, end + 1));
    }
    if (!current.empty()) {
        blocks.push_back(current);
    }

    for (const auto& block : blocks) {
        RegistryEntry entry;
        entry["operator"] = trim(block[0]);
        for (size_t i = 1; i < block.size(); ++i) {
            size_t colon = block[i].find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = trim(block[i].substr(0, colon));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            entry[key] = trim(block[i].substr(colon + 1));
        }
        ops.push_back(entry);
    }
    return ops;
}

std::string format_bundle(const BundleResult& result) {
    std::ostringstream oss;
    oss << "FOLDER: " << result.folder.string() << "\n";
    oss << "STATUS: " << (result.ok ? "PASS" : "FAIL") << "\n";
    oss << "MANIFEST_STATUS: " << (result.manifest_ok ? "PASS" : "FAIL");
    if (!result.missing_files.empty()) {
        oss << "\nMISSING_FILES:";
        for (const auto& m : result.missing_files) {
            oss << "\n  " << m;
        }
    }
    if (!result.manifest_errors.empty()) {
        oss << "\nMANIFEST_ERRORS:";
        for (const auto& e : result.manifest_errors) {
            oss << "\n  " << e;
        }
    }
    return oss.str();
}

std::string VerifierReport::text() const {
    std::ostringstream oss;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            oss << "\n";
        }
        oss << lines[i];
    }
    return oss.str();
}

VerifierReport run_verifier(const VerifierOptions& options) {
    VerifierReport report;
    const fs::path outputs_dir = resolve(options.outputs_dir);

    if (!fs::is_directory(outputs_dir)) {
        report.lines.push_back("FAIL: outputs_dir_not_found: " + outputs_dir.string());
        return report;
    }
    report.outputs_found = true;

    const BundleSpec spec = stream_bundle_spec();

    fs::path registry_path = outputs_dir / REGISTRY_PHASEC;
    if (!fs::is_regular_file(registry_path)) {
        registry_path = outputs_dir / REGISTRY_DEFAULT;
    }
    std::vector<RegistryEntry> ops;
    if (options.use_registry) {
        ops = parse_operator_registry(registry_path);
    }

    auto& lines = report.lines;
    lines.push_back("SBM CONFORMANCE VERIFIER");
    lines.push_back(ops.empty() ? "MODE: phasec_autodiscovery" : "MODE: registry");
    if (options.use_registry) {
        lines.push_back("REGISTRY: " + registry_path.string());
        lines.push_back(std::string("PHASEC_ONLY: ") + (options.phasec_only ? "YES" : "NO"));
    }
    lines.push_back("");

    bool overall_ok = true;

    if (!ops.empty()) {
        const fs::path base = outputs_dir.parent_path();
        for (const auto& op : ops) {
            std::string op_name = lookup(op, "operator");
            if (op_name.empty()) {
                op_name = "UNKNOWN";
            }
            const std::string primary_rel = lookup(op, "primary_folder");
            const std::string replay_rel = lookup(op, "replay_folder");

            if (options.phasec_only && op_name.find(FRACTURE_TAG) == std::string::npos) {
                continue;
            }

            lines.push_back("OPERATOR: " + op_name);

            const bool has_primary = !primary_rel.empty();
            const fs::path primary = has_primary ? resolve(base / primary_rel) : fs::path();
            const fs::path replay = replay_rel.empty() ? fs::path() : resolve(base / replay_rel);
            const bool primary_dir = has_primary && fs::is_directory(primary);

            if (!primary_dir) {
                lines.push_back("PRIMARY_BUNDLE: FAIL (missing_or_invalid_primary_folder)");
                overall_ok = false;
            } else {
                BundleResult res = verify_bundle(primary, spec);
                lines.push_back("PRIMARY_BUNDLE:");
                lines.push_back(format_bundle(res));
                overall_ok = overall_ok && res.ok;
            }

            if (!replay_rel.empty()) {
                const bool replay_dir = fs::is_directory(replay);
                if (!replay_dir) {
                    lines.push_back("REPLAY_BUNDLE: FAIL (missing_or_invalid_replay_folder)");
                    overall_ok = false;
                } else {
                    BundleResult res = verify_bundle(replay, spec);
                    lines.push_back("REPLAY_BUNDLE:");
                    lines.push_back(format_bundle(res));
                    overall_ok = overall_ok && res.ok;
                }

                if (primary_dir && replay_dir) {
                    auto cmp = compare_manifests(primary, replay, spec.manifest_name);
                    lines.push_back(std::string("PRIMARY_VS_REPLAY_MANIFEST: ") +
                                    (cmp.first ? "PASS" : "FAIL") + " (" + cmp.second + ")");
                    overall_ok = overall_ok && cmp.first;
                }
            }
            lines.push_back("");
        }
    } else {
        std::vector<fs::path> children;
        for (const auto& entry : fs::directory_iterator(outputs_dir)) {
            children.push_back(entry.path());
        }
        std::sort(children.begin(), children.end());

        for (const auto& child : children) {
            if (!fs::is_directory(child) || !fs::is_regular_file(child / spec.manifest_name)) {
                continue;
            }
            BundleResult res = verify_bundle(child, spec);
            lines.push_back(format_bundle(res));
            lines.push_back("");
            overall_ok = overall_ok && res.ok;
        }
    }

    lines.push_back(std::string("OVERALL_STATUS: ") + (overall_ok ? "PASS" : "FAIL"));
    report.overall_ok = overall_ok;
    return report;
}

} // namespace sbm
