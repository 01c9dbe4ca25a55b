#pragma once

#include "graph/edge.hpp"

#include <vector>

namespace warmpath {

/// Difference between two edge generations, keyed by (from, to, type).
struct EdgeSetDelta {
    std::vector<Relationship> added;
    std::vector<Relationship> removed;
    std::vector<Relationship> changed_before;
    std::vector<Relationship> changed_after;

    bool empty() const {
        return added.empty() && removed.empty() && changed_after.empty();
    }

    size_t size() const {
        return added.size() + removed.size() + changed_after.size();
    }
};

/// Diff utility for comparing two edge generations.
class EdgeSetDiff {
public:
    /// Compute the delta that turns `from` into `to`.
    static EdgeSetDelta diff(const std::vector<Relationship>& from,
                             const std::vector<Relationship>& to);

    /// Edges whose (from, to, type) key appears more than once.
    static std::vector<Relationship> duplicates(const std::vector<Relationship>& edges);
};

} // namespace warmpath
