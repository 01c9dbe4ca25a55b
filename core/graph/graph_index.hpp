#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warmpath {

/// One entry of a person's adjacency list.
struct Adjacency {
    PersonId neighbor;
    RelationshipType type;
    const Relationship* edge;  // owned by the GraphIndex
};

// ─── GraphIndex ────────────────────────────────────────────────
// Read-only adjacency view over one ingestion generation.
// Built in a single pass over persons and edges; there is no mutation
// API. Callers needing fresher data build a new index and publish it
// through IndexSnapshot.

class GraphIndex {
public:
    GraphIndex() = default;
    GraphIndex(const GraphIndex&) = delete;
    GraphIndex& operator=(const GraphIndex&) = delete;
    GraphIndex(GraphIndex&&) = default;
    GraphIndex& operator=(GraphIndex&&) = default;

    /// Build an index. Edges with an endpoint missing from `persons`
    /// (or self-loops) are dropped and counted in orphanedEdges().
    static GraphIndex build(std::vector<Person> persons,
                            std::vector<Relationship> edges,
                            uint64_t generation = 0);

    // ── Persons ──
    const Person* getPerson(const PersonId& id) const;
    bool contains(const PersonId& id) const { return persons_.count(id) > 0; }
    std::vector<PersonId> getPersonIds() const;
    size_t personCount() const { return persons_.size(); }

    // ── Edges ──
    size_t edgeCount() const { return edges_.size(); }
    size_t orphanedEdges() const { return orphaned_edges_; }

    // ── Adjacency queries ──
    const std::vector<Adjacency>& neighbors(const PersonId& id) const;
    std::vector<const Relationship*> edgesBetween(const PersonId& a, const PersonId& b) const;

    /// Strongest edge from a to b; ties go to the higher trust rank.
    const Relationship* strongestEdge(const PersonId& a, const PersonId& b) const;

    // ── Iteration ──
    void forEachPerson(const std::function<void(const Person&)>& fn) const;
    void forEachEdge(const std::function<void(const Relationship&)>& fn) const;

    uint64_t generation() const { return generation_; }
    std::chrono::system_clock::time_point builtAt() const { return built_at_; }

private:
    std::unordered_map<PersonId, Person> persons_;
    std::vector<Relationship> edges_;
    std::unordered_map<PersonId, std::vector<Adjacency>> adjacency_;
    size_t orphaned_edges_ = 0;
    uint64_t generation_ = 0;
    std::chrono::system_clock::time_point built_at_{};
};

} // namespace warmpath
