#include "graph/graph_index.hpp"

#include <algorithm>

namespace warmpath {

GraphIndex GraphIndex::build(std::vector<Person> persons,
                             std::vector<Relationship> edges,
                             uint64_t generation) {
    GraphIndex index;
    index.generation_ = generation;
    index.built_at_ = std::chrono::system_clock::now();

    index.persons_.reserve(persons.size());
    for (auto& p : persons) {
        PersonId id = p.id;
        index.adjacency_[id];  // ensure entry exists
        index.persons_.emplace(std::move(id), std::move(p));
    }

    index.edges_.reserve(edges.size());
    for (auto& e : edges) {
        if (e.from == e.to || !index.contains(e.from) || !index.contains(e.to)) {
            index.orphaned_edges_++;
            continue;
        }
        index.edges_.push_back(std::move(e));
    }

    // Adjacency holds pointers into edges_, so fill it only after edges_
    // stops growing.
    for (const auto& e : index.edges_) {
        index.adjacency_[e.from].push_back(Adjacency{e.to, e.type, &e});
    }
    return index;
}

// ─── Persons ───────────────────────────────────────────────────

const Person* GraphIndex::getPerson(const PersonId& id) const {
    auto it = persons_.find(id);
    return it != persons_.end() ? &it->second : nullptr;
}

std::vector<PersonId> GraphIndex::getPersonIds() const {
    std::vector<PersonId> ids;
    ids.reserve(persons_.size());
    for (const auto& [id, _] : persons_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Adjacency queries ────────────────────────────────────────

const std::vector<Adjacency>& GraphIndex::neighbors(const PersonId& id) const {
    static const std::vector<Adjacency> empty;
    auto it = adjacency_.find(id);
    return it != adjacency_.end() ? it->second : empty;
}

std::vector<const Relationship*> GraphIndex::edgesBetween(const PersonId& a, const PersonId& b) const {
    std::vector<const Relationship*> result;
    for (const auto& adj : neighbors(a)) {
        if (adj.neighbor == b) result.push_back(adj.edge);
    }
    return result;
}

const Relationship* GraphIndex::strongestEdge(const PersonId& a, const PersonId& b) const {
    const Relationship* best = nullptr;
    for (const auto& adj : neighbors(a)) {
        if (adj.neighbor != b) continue;
        const Relationship* e = adj.edge;
        if (!best || e->strength > best->strength ||
            (e->strength == best->strength && trustRank(e->type) > trustRank(best->type))) {
            best = e;
        }
    }
    return best;
}

// ─── Iteration ────────────────────────────────────────────────

void GraphIndex::forEachPerson(const std::function<void(const Person&)>& fn) const {
    for (const auto& [_, person] : persons_) {
        fn(person);
    }
}

void GraphIndex::forEachEdge(const std::function<void(const Relationship&)>& fn) const {
    for (const auto& e : edges_) {
        fn(e);
    }
}

} // namespace warmpath
