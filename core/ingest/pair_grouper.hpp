#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace warmpath {

// ─── PairGrouper ───────────────────────────────────────────────
// Grouping-then-pairing step shared by the extractors.
//
// Members are added under a normalized key; forEachPair() visits every
// unordered pair of distinct members inside each group. Groups larger
// than `max_group_size` are reduced to a deterministic seeded sample, so
// the work per rebuild is bounded by O(sum over groups of min(g, cap)^2).
//
// Keys and members are visited in sorted order, making the output
// independent of insertion order.

class PairGrouper {
public:
    PairGrouper(size_t max_group_size, uint64_t seed)
        : max_group_size_(max_group_size), seed_(seed) {}

    /// Add member index `member` to group `key`. Empty keys are ignored;
    /// repeated (key, member) adds are collapsed.
    void add(const std::string& key, size_t member);

    /// fn(key, a, b) with a < b, for every pair in every group.
    void forEachPair(const std::function<void(const std::string&, size_t, size_t)>& fn) const;

    size_t groupCount() const { return groups_.size(); }

    /// Number of groups that were sampled down.
    size_t sampledGroups() const;

    /// Upper bound on pairs forEachPair() will visit.
    size_t pairBudget() const;

private:
    std::vector<size_t> membersOf(const std::string& key, const std::vector<size_t>& all) const;

    size_t max_group_size_;
    uint64_t seed_;
    std::map<std::string, std::vector<size_t>> groups_;
};

} // namespace warmpath
