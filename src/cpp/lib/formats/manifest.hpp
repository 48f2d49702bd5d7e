#ifndef SBM_FORMATS_MANIFEST_HPP
#define SBM_FORMATS_MANIFEST_HPP

#include "../common.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sbm {

/**
 * SHA-256 Manifests
 *
 * Written as "<hex digest>  <basename>" lines. Parsing also accepts the
 * other common layouts:
 *   <hex>  name        <hex> *name
 *   SHA256 (name) = <hex>     SHA-256(name)=<hex>     name = <hex>
 *   any line holding a 64-digit hex token (the rest is the name)
 */

struct ManifestEntry {
    std::string name;
    std::string digest;  // Lower-case hex
};

// Lower-case hex SHA-256 of a file; throws std::runtime_error if unreadable
std::string sha256_file(const std::filesystem::path& path);

// Lower-case hex SHA-256 of a byte string
std::string sha256_hex(const std::string& data);

/**
 * Hash each file and write the manifest (LF line endings)
 */
void write_manifest(const std::vector<std::filesystem::path>& files,
                    const std::filesystem::path& manifest_path);

/**
 * Parse manifest text; blank and unparseable lines are skipped
 */
std::vector<ManifestEntry> parse_manifest_lines(const std::string& text);

} // namespace sbm

#endif // SBM_FORMATS_MANIFEST_HPP
