#include "manifest.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace sbm {

namespace {
    constexpr size_t HASH_CHUNK_SIZE = 1024 * 1024;

    const std::regex HEX64_TOKEN(R"(\b([0-9a-fA-F]{64})\b)");
    const std::regex HEX64_FULL(R"([0-9a-fA-F]{64})");
    const std::regex SHA_PREFIX(R"(^SHA-?256\s*\()", std::regex::icase);
    const std::regex CLOSING_PAREN(R"(\)\s*$)");

    struct DigestContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

    DigestContext new_sha256_context() {
        DigestContext ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
        return ctx;
    }

    std::string finish_hex(EVP_MD_CTX* ctx) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
            throw std::runtime_error("Failed to finalize SHA-256 digest");
        }
        std::ostringstream oss;
        for (unsigned int i = 0; i < len; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        }
        return oss.str();
    }

    std::string strip(const std::string& s, const std::string& chars = " \t\r\n\f\v") {
        size_t begin = s.find_first_not_of(chars);
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(chars);
        return s.substr(begin, end - begin + 1);
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path.string());
    }

    DigestContext ctx = new_sha256_context();
    std::vector<char> buffer(HASH_CHUNK_SIZE);
    while (ifs) {
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = ifs.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            throw std::runtime_error("Failed to hash file: " + path.string());
        }
    }
    if (ifs.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return finish_hex(ctx.get());
}

std::string sha256_hex(const std::string& data) {
    DigestContext ctx = new_sha256_context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to hash buffer");
    }
    return finish_hex(ctx.get());
}

void write_manifest(const std::vector<std::filesystem::path>& files,
                    const std::filesystem::path& manifest_path) {
    std::ofstream ofs(manifest_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + manifest_path.string());
    }
    for (const auto& file : files) {
        ofs << sha256_file(file) << "  " << file.filename().string() << "\n";
    }
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + manifest_path.string());
    }
}

std::vector<ManifestEntry> parse_manifest_lines(const std::string& text) {
    std::vector<ManifestEntry> entries;
    std::istringstream iss(text);
    std::string raw;

    while (std::getline(iss, raw)) {
        const std::string line = strip(raw);
        if (line.empty()) {
            continue;
        }

        // name = digest, optionally wrapped as SHA256 (name)
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string left = strip(line.substr(0, eq));
            std::string right = strip(line.substr(eq + 1));
            std::smatch m;
            if (!std::regex_search(right, m, HEX64_TOKEN)) {
                continue;
            }
            std::string name = std::regex_replace(left, SHA_PREFIX, "");
            name = strip(std::regex_replace(name, CLOSING_PAREN, ""));
            if (!name.empty()) {
                entries.push_back({name, to_lower(m[1].str())});
            }
            continue;
        }

        // digest  name (coreutils layout)
        std::istringstream parts_stream(line);
        std::vector<std::string> parts;
        std::string part;
        while (parts_stream >> part) {
            parts.push_back(part);
        }
        if (parts.size() >= 2 && std::regex_match(parts[0], HEX64_FULL)) {
            std::string name;
            for (size_t i = 1; i < parts.size(); ++i) {
                if (i > 1) {
                    name += " ";
                }
                name += parts[i];
            }
            size_t first = name.find_first_not_of('*');
            name = first == std::string::npos ? "" : name.substr(first);
            entries.push_back({name, to_lower(parts[0])});
            continue;
        }

        // Free-form: any 64-digit token, remainder is the name
        std::smatch m;
        if (std::regex_search(line, m, HEX64_TOKEN)) {
            std::string rest = line.substr(0, static_cast<size_t>(m.position(0))) +
                               line.substr(static_cast<size_t>(m.position(0) + m.length(0)));
            rest = strip(strip(rest), " -\t");
            if (!rest.empty()) {
                entries.push_back({rest, to_lower(m[1].str())});
            }
        }
    }
    return entries;
}

} // namespace sbm
