#ifndef SBM_ENGINE_ALPHABET_HPP
#define SBM_ENGINE_ALPHABET_HPP

#include "../common.hpp"
#include "signature.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sbm {

/**
 * One point of the growth curve: alphabet size right after index `index`
 */
struct AlphaPoint {
    Index index;
    size_t alpha;
    bool is_new;
};

/**
 * Per-index result record handed to the results writer
 */
struct ResultRecord {
    Index index;
    Signature signature;
    bool is_new;
    Index first_seen;
};

using AlphaSeries = std::vector<AlphaPoint>;
using Checkpoint = std::pair<Index, size_t>;   // (index, alpha(index))
using ResultSink = std::function<void(const ResultRecord&)>;

/**
 * Incremental alphabet of distinct signatures
 *
 * Signatures must be fed in strictly ascending index order. Each signature
 * keeps the index at which it was first observed; that index never changes.
 * The alpha series grows by one point per observed index.
 */
class AlphabetTracker {
public:
    AlphabetTracker() = default;

    // Throws std::logic_error if n does not exceed the previous index
    ResultRecord observe(Index n, const Signature& signature);

    size_t size() const { return first_seen_.size(); }
    bool empty() const { return first_seen_.empty(); }
    const AlphaSeries& series() const { return series_; }

    std::optional<Index> first_seen(const Signature& signature) const;

private:
    std::unordered_map<Signature, Index, SignatureHash> first_seen_;
    AlphaSeries series_;
};

/**
 * Sweep a source in ascending index order through the tracker.
 * Each result record is passed to `sink` (if set) as soon as it is produced.
 */
void run_sweep(const SignatureSource& source, AlphabetTracker& tracker,
               const ResultSink& sink = nullptr);

/**
 * Alpha value at each candidate index present in the series.
 * Candidates are sorted and deduplicated; indices absent from the series are dropped.
 */
std::vector<Checkpoint> select_checkpoints(const AlphaSeries& series,
                                           std::vector<int64_t> candidates);

// Conventional checkpoint candidates
std::vector<int64_t> operator_checkpoint_candidates(Index N);
std::vector<int64_t> stream_checkpoint_candidates(Index N, Index shift_n);

} // namespace sbm

#endif // SBM_ENGINE_ALPHABET_HPP
