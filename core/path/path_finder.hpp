#pragma once

#include "graph/graph_index.hpp"
#include "path/path_state.hpp"

#include <optional>
#include <set>
#include <vector>

namespace warmpath {

/// Path Discovery: bounded breadth-first enumeration of simple paths
/// through a GraphIndex, ranked by weakest-link (multiplicative) score.
///
/// Pure read over an immutable index, so concurrent calls are safe.
class PathFinder {
public:
    explicit PathFinder(PathConfig config = PathConfig());

    /// Best paths from `source` to `target` within `max_hops`
    /// (default PathConfig::default_max_hops, clamped to hop_limit).
    PathResult find(const GraphIndex& index,
                    const PersonId& source,
                    const PersonId& target,
                    std::optional<int> max_hops = std::nullopt) const;

    /// Best paths from `source` to any of `targets`, merged and ranked
    /// together. Used with candidates from the identity matcher.
    PathResult findToAny(const GraphIndex& index,
                         const PersonId& source,
                         const std::vector<PersonId>& targets,
                         std::optional<int> max_hops = std::nullopt) const;

    /// 100 * product(strength_i / 100). Empty hop lists score 0.
    static double score(const std::vector<PathHop>& hops);

    const PathConfig& config() const { return config_; }

private:
    int resolveHops(std::optional<int> max_hops) const;

    /// Enumerate simple paths ending at any person in `targets`. Stops
    /// after config_.max_expansions partial paths, setting `exhausted`.
    std::vector<std::vector<PersonId>> enumerate(const GraphIndex& index,
                                                 const PersonId& source,
                                                 const std::set<PersonId>& targets,
                                                 int max_hops,
                                                 int& expansions,
                                                 bool& exhausted) const;

    Path makePath(const GraphIndex& index, std::vector<PersonId> people) const;

    PathConfig config_;
};

} // namespace warmpath
