#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"

#include <string>
#include <vector>

namespace warmpath {

/// Path discovery configuration parameters.
struct PathConfig {
    int default_max_hops = 3;       // used when the caller gives no bound
    int hop_limit = 6;              // requested bounds are clamped to this
    size_t top_n = 10;              // paths returned per request
    int max_expansions = 200000;    // partial paths expanded per request
};

/// One hop of a path: the strongest edge between two consecutive people.
struct PathHop {
    PersonId from;
    PersonId to;
    RelationshipType type = RelationshipType::Social;
    int strength = 0;
    int confidence = 0;
};

/// An introduction chain from source to target.
struct Path {
    std::vector<PersonId> people;          // source ... target
    std::vector<PathHop> hops;
    std::vector<RelationshipType> edge_types;  // one per hop
    double score = 0.0;                    // 100 * product(strength / 100)
    std::vector<PersonId> ghost_ids;       // unverified people on the path
    bool requires_invitation = false;      // an intermediary is a ghost

    int hopCount() const { return static_cast<int>(hops.size()); }
    bool containsGhost() const { return !ghost_ids.empty(); }

    /// Hops over coworker, education or family edges.
    int highTrustHops() const;

    /// Number of different edge types used.
    int distinctTypes() const;
};

enum class PathStatus {
    Found,
    NoPathWithinBound,
    SourceNotFound,
    TargetNotFound,
    SamePerson
};

std::string toString(PathStatus status);

/// Result of a path discovery request. Not finding a path is a valid
/// outcome, reported through `status`.
struct PathResult {
    PathStatus status = PathStatus::NoPathWithinBound;
    std::vector<Path> paths;        // best first
    double top_score = 0.0;
    int max_hops = 0;               // bound actually used
    int expansions = 0;
    bool budget_exhausted = false;
    std::string message;

    bool found() const { return status == PathStatus::Found; }
};

/// Ranking order: score desc, hops asc, high-trust hops desc, distinct
/// types desc, then person sequence.
bool rankedBefore(const Path& a, const Path& b);

} // namespace warmpath
