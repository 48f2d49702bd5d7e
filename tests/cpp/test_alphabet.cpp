// Alphabet tests - distinct-signature tracking, sweeps and checkpoints
#include "engine/alphabet.hpp"
#include "engine/signature.hpp"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace sbm;

// Signature source backed by a fixed list, starting at `first`
class ListSource : public SignatureSource {
public:
    ListSource(Index first, std::vector<Signature> signatures)
        : first_(first), signatures_(std::move(signatures)) {}

    Index first_index() const override { return first_; }
    Index end_index() const override { return first_ + signatures_.size(); }
    Signature signature_at(Index n) const override { return signatures_.at(n - first_); }

private:
    Index first_;
    std::vector<Signature> signatures_;
};

Signature bits(std::vector<uint32_t> values) {
    return Signature(std::move(values));
}

void test_signature_identity() {
    std::cout << "Test 1: Signature equality, hashing and text... ";

    SignatureHash hash;
    assert(bits({1, 0}) == bits({1, 0}));
    assert(bits({1, 0}) != bits({0, 1}));
    assert(bits({1}) != bits({1, 1}));
    assert(hash(bits({1, 0, 1})) == hash(bits({1, 0, 1})));

    // A banded pair never equals a plain trace with the same numbers
    assert(Signature('A', 3) != bits({3}));
    assert(Signature('A', 3) == Signature('A', 3));
    assert(Signature('A', 3) != Signature('B', 3));

    assert(bits({1, 0, 1}).to_string() == "(1, 0, 1)");
    assert(bits({0}).to_string() == "(0,)");
    assert(Signature('P', 0).to_string() == "('P', 0)");

    std::unordered_set<Signature, SignatureHash> set;
    set.insert(bits({1, 0}));
    set.insert(bits({1, 0}));
    set.insert(Signature('A', 0));
    assert(set.size() == 2);

    std::cout << "PASSED\n";
}

void test_tracker_growth() {
    std::cout << "Test 2: Alphabet growth and first-seen indices... ";

    AlphabetTracker tracker;
    assert(tracker.empty());

    ResultRecord r0 = tracker.observe(0, bits({1}));
    ResultRecord r1 = tracker.observe(1, bits({0}));
    ResultRecord r2 = tracker.observe(2, bits({1}));
    ResultRecord r3 = tracker.observe(5, bits({0}));

    assert(r0.is_new && r0.first_seen == 0);
    assert(r1.is_new && r1.first_seen == 1);
    assert(!r2.is_new && r2.first_seen == 0);
    assert(!r3.is_new && r3.first_seen == 1);
    assert(r3.index == 5);

    assert(tracker.size() == 2);
    assert(tracker.first_seen(bits({1})) == Index(0));
    assert(tracker.first_seen(bits({0})) == Index(1));
    assert(!tracker.first_seen(bits({1, 1})).has_value());

    const AlphaSeries& series = tracker.series();
    assert(series.size() == 4);
    assert(series[0].alpha == 1 && series[1].alpha == 2);
    assert(series[2].alpha == 2 && series[3].alpha == 2);
    assert(series[3].index == 5);

    std::cout << "PASSED\n";
}

void test_out_of_order_rejected() {
    std::cout << "Test 3: Non-ascending indices are rejected... ";

    AlphabetTracker tracker;
    tracker.observe(3, bits({1}));

    bool threw = false;
    try {
        tracker.observe(3, bits({0}));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(tracker.size() == 1);
    assert(tracker.series().size() == 1);

    std::cout << "PASSED\n";
}

void test_sweep_monotone() {
    std::cout << "Test 4: Sweep keeps alpha monotone and bounded... ";

    std::vector<Signature> sigs;
    for (uint32_t i = 0; i < 50; ++i) {
        sigs.push_back(bits({i % 7, (i * 3) % 5}));
    }
    ListSource source(2, sigs);

    AlphabetTracker tracker;
    std::vector<ResultRecord> records;
    run_sweep(source, tracker, [&records](const ResultRecord& r) { records.push_back(r); });

    assert(records.size() == 50);
    assert(records.front().index == 2);
    assert(records.back().index == 51);

    const AlphaSeries& series = tracker.series();
    size_t prev = 0;
    size_t new_count = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        assert(series[i].alpha >= prev);
        assert(series[i].alpha - prev <= 1);
        assert(series[i].alpha <= i + 1);
        if (series[i].is_new) {
            ++new_count;
            assert(records[i].first_seen == records[i].index);
        } else {
            assert(records[i].first_seen < records[i].index);
        }
        prev = series[i].alpha;
    }
    assert(new_count == tracker.size());
    assert(tracker.size() == 35);  // (i mod 7, i mod 5) covers all pairs within 35 steps

    // Sweep without a sink
    AlphabetTracker silent;
    run_sweep(source, silent);
    assert(silent.size() == tracker.size());

    std::cout << "PASSED\n";
}

void test_checkpoint_selection() {
    std::cout << "Test 5: Checkpoint selection... ";

    AlphaSeries series;
    for (Index n = 2; n <= 300; ++n) {
        series.push_back(AlphaPoint{n, static_cast<size_t>(n / 10), false});
    }

    auto cps = select_checkpoints(series, operator_checkpoint_candidates(300));
    assert(cps.size() == 3);
    assert(cps[0] == Checkpoint(100, 10));
    assert(cps[1] == Checkpoint(200, 20));
    assert(cps[2] == Checkpoint(300, 30));

    // N itself coinciding with a round number appears once
    cps = select_checkpoints(series, operator_checkpoint_candidates(200));
    assert(cps.size() == 2);

    // Negative and absent candidates are dropped, order is ascending
    cps = select_checkpoints(series, {250, -1, 1, 7, 250, 5000});
    assert(cps.size() == 2);
    assert(cps[0].first == 7);
    assert(cps[1].first == 250);

    // Stream candidates include the indices around the shift
    auto candidates = stream_checkpoint_candidates(10, 0);
    AlphaSeries stream;
    for (Index n = 0; n < 10; ++n) {
        stream.push_back(AlphaPoint{n, static_cast<size_t>(n + 1), true});
    }
    cps = select_checkpoints(stream, candidates);
    assert(cps.size() == 2);
    assert(cps[0] == Checkpoint(0, 1));
    assert(cps[1] == Checkpoint(9, 10));

    assert(select_checkpoints(AlphaSeries{}, {100}).empty());

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "===========================================\n";
    std::cout << "Running Alphabet Tests\n";
    std::cout << "===========================================\n\n";

    try {
        test_signature_identity();
        test_tracker_growth();
        test_out_of_order_rejected();
        test_sweep_monotone();
        test_checkpoint_selection();

        std::cout << "\n===========================================\n";
        std::cout << "All alphabet tests PASSED!\n";
        std::cout << "===========================================\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
