#include "alphabet.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace sbm {

namespace {
    const int64_t ROUND_CHECKPOINTS[] = {
        100, 200, 500, 1000, 2000, 5000, 10000, 20000, 50000, 100000
    };
}

ResultRecord AlphabetTracker::observe(Index n, const Signature& signature) {
    if (!series_.empty() && n <= series_.back().index) {
        throw std::logic_error("Index " + std::to_string(n) +
                               " observed after index " + std::to_string(series_.back().index));
    }

    auto inserted = first_seen_.emplace(signature, n);
    const bool is_new = inserted.second;
    series_.push_back(AlphaPoint{n, first_seen_.size(), is_new});

    return ResultRecord{n, signature, is_new, inserted.first->second};
}

std::optional<Index> AlphabetTracker::first_seen(const Signature& signature) const {
    auto it = first_seen_.find(signature);
    if (it == first_seen_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void run_sweep(const SignatureSource& source, AlphabetTracker& tracker, const ResultSink& sink) {
    for (Index n = source.first_index(); n < source.end_index(); ++n) {
        ResultRecord record = tracker.observe(n, source.signature_at(n));
        if (sink) {
            sink(record);
        }
    }
}

std::vector<Checkpoint> select_checkpoints(const AlphaSeries& series,
                                           std::vector<int64_t> candidates) {
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    std::vector<Checkpoint> checkpoints;
    for (int64_t c : candidates) {
        if (c < 0) {
            continue;
        }
        const Index idx = static_cast<Index>(c);
        auto it = std::lower_bound(series.begin(), series.end(), idx,
                                   [](const AlphaPoint& p, Index value) { return p.index < value; });
        if (it != series.end() && it->index == idx) {
            checkpoints.emplace_back(idx, it->alpha);
        }
    }
    return checkpoints;
}

std::vector<int64_t> operator_checkpoint_candidates(Index N) {
    std::vector<int64_t> candidates(std::begin(ROUND_CHECKPOINTS), std::end(ROUND_CHECKPOINTS));
    candidates.push_back(static_cast<int64_t>(N));
    return candidates;
}

std::vector<int64_t> stream_checkpoint_candidates(Index N, Index shift_n) {
    std::vector<int64_t> candidates(std::begin(ROUND_CHECKPOINTS), std::end(ROUND_CHECKPOINTS));
    candidates.push_back(static_cast<int64_t>(shift_n) - 1);
    candidates.push_back(static_cast<int64_t>(shift_n));
    candidates.push_back(static_cast<int64_t>(N) - 1);
    return candidates;
}

} // namespace sbm
