#include "graph/edge_diff.hpp"

#include <map>
#include <set>
#include <tuple>

namespace warmpath {

namespace {

using EdgeKey = std::tuple<PersonId, PersonId, RelationshipType>;

EdgeKey keyOf(const Relationship& e) {
    return EdgeKey(e.from, e.to, e.type);
}

} // namespace

EdgeSetDelta EdgeSetDiff::diff(const std::vector<Relationship>& from,
                               const std::vector<Relationship>& to) {
    EdgeSetDelta delta;

    std::map<EdgeKey, const Relationship*> from_index;
    for (const auto& e : from) from_index.emplace(keyOf(e), &e);

    std::set<EdgeKey> seen;
    for (const auto& e : to) {
        EdgeKey k = keyOf(e);
        if (!seen.insert(k).second) continue;

        auto it = from_index.find(k);
        if (it == from_index.end()) {
            delta.added.push_back(e);
        } else if (*it->second != e) {
            delta.changed_before.push_back(*it->second);
            delta.changed_after.push_back(e);
        }
    }

    for (const auto& [k, e] : from_index) {
        if (!seen.count(k)) delta.removed.push_back(*e);
    }
    return delta;
}

std::vector<Relationship> EdgeSetDiff::duplicates(const std::vector<Relationship>& edges) {
    std::set<EdgeKey> seen;
    std::vector<Relationship> dups;
    for (const auto& e : edges) {
        if (!seen.insert(keyOf(e)).second) dups.push_back(e);
    }
    return dups;
}

} // namespace warmpath
