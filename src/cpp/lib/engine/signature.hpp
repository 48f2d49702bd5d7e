#ifndef SBM_ENGINE_SIGNATURE_HPP
#define SBM_ENGINE_SIGNATURE_HPP

#include "../common.hpp"
#include <cstddef>
#include <utility>
#include <string>
#include <vector>

namespace sbm {

/**
 * Fixed-width signature observed at one index
 *
 * Either a plain tuple of small integers (bit/residue traces) or a banded
 * pair (band letter, bucket), in which case `band` is non-zero and
 * `symbols` holds the single bucket. Equality is elementwise.
 *
 * Text form: (1, 0, 1)   (1,)   ('A', 3)
 */
struct Signature {
    char band = 0;
    std::vector<uint32_t> symbols;

    Signature() = default;
    explicit Signature(std::vector<uint32_t> values) : symbols(std::move(values)) {}
    Signature(char band_letter, uint32_t bucket) : band(band_letter), symbols{bucket} {}

    bool is_banded() const { return band != 0; }
    size_t width() const { return symbols.size() + (is_banded() ? 1 : 0); }

    std::string to_string() const;

    bool operator==(const Signature& other) const {
        return band == other.band && symbols == other.symbols;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }
};

struct SignatureHash {
    size_t operator()(const Signature& sig) const;
};

/**
 * Producer of one signature per index over a contiguous index range
 *
 * Implementations are pure: signature_at(n) depends only on n and the
 * configuration captured at construction.
 */
class SignatureSource {
public:
    virtual ~SignatureSource() = default;

    virtual Index first_index() const = 0;
    virtual Index end_index() const = 0;   // One past the last index
    virtual Signature signature_at(Index n) const = 0;

    Index count() const { return end_index() > first_index() ? end_index() - first_index() : 0; }
};

} // namespace sbm

#endif // SBM_ENGINE_SIGNATURE_HPP
