#include "path/path_finder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_set>

namespace warmpath {

// ─── Path helpers ──────────────────────────────────────────────

int Path::highTrustHops() const {
    int n = 0;
    for (RelationshipType t : edge_types) {
        if (isHighTrust(t)) n++;
    }
    return n;
}

int Path::distinctTypes() const {
    std::set<RelationshipType> types(edge_types.begin(), edge_types.end());
    return static_cast<int>(types.size());
}

std::string toString(PathStatus status) {
    switch (status) {
        case PathStatus::Found:             return "found";
        case PathStatus::NoPathWithinBound: return "no_path_within_bound";
        case PathStatus::SourceNotFound:    return "source_not_found";
        case PathStatus::TargetNotFound:    return "target_not_found";
        case PathStatus::SamePerson:        return "same_person";
    }
    return "no_path_within_bound";
}

bool rankedBefore(const Path& a, const Path& b) {
    constexpr double kEps = 1e-9;
    if (std::fabs(a.score - b.score) > kEps) return a.score > b.score;
    if (a.hopCount() != b.hopCount()) return a.hopCount() < b.hopCount();
    if (a.highTrustHops() != b.highTrustHops()) return a.highTrustHops() > b.highTrustHops();
    if (a.distinctTypes() != b.distinctTypes()) return a.distinctTypes() > b.distinctTypes();
    return a.people < b.people;
}

// ─── PathFinder ────────────────────────────────────────────────

PathFinder::PathFinder(PathConfig config) : config_(std::move(config)) {}

double PathFinder::score(const std::vector<PathHop>& hops) {
    if (hops.empty()) return 0.0;
    double product = 1.0;
    for (const auto& h : hops) {
        product *= std::max(0, std::min(100, h.strength)) / 100.0;
    }
    return product * 100.0;
}

int PathFinder::resolveHops(std::optional<int> max_hops) const {
    int hops = max_hops.value_or(config_.default_max_hops);
    return std::max(1, std::min(hops, config_.hop_limit));
}

std::vector<std::vector<PersonId>> PathFinder::enumerate(const GraphIndex& index,
                                                         const PersonId& source,
                                                         const std::set<PersonId>& targets,
                                                         int max_hops,
                                                         int& expansions,
                                                         bool& exhausted) const {
    std::vector<std::vector<PersonId>> found;
    std::deque<std::vector<PersonId>> frontier;
    frontier.push_back({source});

    while (!frontier.empty()) {
        if (expansions >= config_.max_expansions) {
            exhausted = true;
            break;
        }
        std::vector<PersonId> partial = std::move(frontier.front());
        frontier.pop_front();
        expansions++;

        // A pair may be joined by several typed edges; visit each
        // neighbor once.
        std::unordered_set<PersonId> visited_neighbors;
        for (const auto& adj : index.neighbors(partial.back())) {
            const PersonId& next = adj.neighbor;
            if (!visited_neighbors.insert(next).second) continue;
            if (std::find(partial.begin(), partial.end(), next) != partial.end()) continue;

            std::vector<PersonId> extended = partial;
            extended.push_back(next);

            bool is_target = targets.count(next) > 0;
            if (is_target) {
                found.push_back(extended);
            }
            // A matched candidate may still lead on to another one.
            bool extend = !is_target || targets.size() > 1;
            if (extend && static_cast<int>(extended.size()) - 1 < max_hops) {
                frontier.push_back(std::move(extended));
            }
        }
    }
    return found;
}

Path PathFinder::makePath(const GraphIndex& index, std::vector<PersonId> people) const {
    Path path;
    path.people = std::move(people);

    for (size_t i = 0; i + 1 < path.people.size(); i++) {
        const Relationship* e = index.strongestEdge(path.people[i], path.people[i + 1]);
        PathHop hop;
        hop.from = path.people[i];
        hop.to = path.people[i + 1];
        if (e) {
            hop.type = e->type;
            hop.strength = e->strength;
            hop.confidence = e->confidence;
        }
        path.edge_types.push_back(hop.type);
        path.hops.push_back(std::move(hop));
    }
    path.score = score(path.hops);

    for (size_t i = 0; i < path.people.size(); i++) {
        const Person* p = index.getPerson(path.people[i]);
        if (!p || !p->isGhost()) continue;
        path.ghost_ids.push_back(p->id);
        if (i > 0 && i + 1 < path.people.size()) {
            path.requires_invitation = true;
        }
    }
    return path;
}

PathResult PathFinder::find(const GraphIndex& index,
                            const PersonId& source,
                            const PersonId& target,
                            std::optional<int> max_hops) const {
    return findToAny(index, source, std::vector<PersonId>{target}, max_hops);
}

PathResult PathFinder::findToAny(const GraphIndex& index,
                                 const PersonId& source,
                                 const std::vector<PersonId>& targets,
                                 std::optional<int> max_hops) const {
    PathResult result;
    result.max_hops = resolveHops(max_hops);

    if (!index.contains(source)) {
        result.status = PathStatus::SourceNotFound;
        result.message = "Source person " + source + " is not in the network";
        return result;
    }

    std::set<PersonId> target_set;
    for (const auto& t : targets) {
        if (index.contains(t) && t != source) target_set.insert(t);
    }
    if (target_set.empty()) {
        bool only_self = !targets.empty() &&
            std::all_of(targets.begin(), targets.end(),
                        [&](const PersonId& t) { return t == source; });
        result.status = only_self ? PathStatus::SamePerson : PathStatus::TargetNotFound;
        result.message = only_self ? "Source and target are the same person"
                                   : "Target person is not in the network";
        return result;
    }

    int expansions = 0;
    bool exhausted = false;
    auto sequences = enumerate(index, source, target_set, result.max_hops, expansions, exhausted);
    result.expansions = expansions;
    result.budget_exhausted = exhausted;

    std::set<std::vector<PersonId>> seen;
    std::vector<Path> paths;
    for (auto& seq : sequences) {
        if (!seen.insert(seq).second) continue;
        paths.push_back(makePath(index, std::move(seq)));
    }

    std::sort(paths.begin(), paths.end(), rankedBefore);
    if (paths.size() > config_.top_n) paths.resize(config_.top_n);

    if (exhausted) {
        spdlog::warn("[PathFinder] Budget exhausted after {} expansions from {}", result.expansions, source);
    }

    if (paths.empty()) {
        result.status = PathStatus::NoPathWithinBound;
        result.message = "No path found within " + std::to_string(result.max_hops) +
                         " hop" + (result.max_hops == 1 ? "" : "s");
        return result;
    }

    result.status = PathStatus::Found;
    result.top_score = paths.front().score;
    result.paths = std::move(paths);
    result.message = "Found " + std::to_string(result.paths.size()) + " path" +
                     (result.paths.size() == 1 ? "" : "s");
    spdlog::debug("[PathFinder] {} -> {} target(s): {} paths, top score {:.2f}",
                  source, target_set.size(), result.paths.size(), result.top_score);
    return result;
}

} // namespace warmpath
