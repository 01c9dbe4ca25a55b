#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"
#include "ingest/strength_model.hpp"

#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace warmpath {

// ─── EdgeEmitter ───────────────────────────────────────────────
// Collects candidate edges from extractors. Each emit() produces both
// directions of an undirected relationship. A repeated (from, to, type)
// keeps the stronger candidate. Self-pairs are dropped.

class EdgeEmitter {
public:
    /// Returns false if the pair was a self-pair.
    bool emit(const PersonId& a, const PersonId& b, RelationshipType type,
              int strength, const std::map<std::string, std::string>& metadata);

    /// Candidates ordered by (from, to, type). Confidence is left at 0;
    /// the engine fills it from the endpoints.
    std::vector<Relationship> edges() const;

    size_t size() const { return edges_.size(); }
    size_t countOf(RelationshipType type) const;

private:
    void put(const PersonId& from, const PersonId& to, RelationshipType type,
             int strength, const std::map<std::string, std::string>& metadata);

    std::map<std::tuple<PersonId, PersonId, RelationshipType>, Relationship> edges_;
};

/// Base class for evidence extractors.
/// An extractor looks at one evidence dimension of every person and
/// emits typed edges for people sharing that dimension. Must be
/// deterministic for identical input.
class RelationshipExtractor {
public:
    virtual ~RelationshipExtractor() = default;

    /// Human-readable name, unique within a registry.
    virtual std::string name() const = 0;

    /// Edge type this extractor produces.
    virtual RelationshipType type() const = 0;

    /// Credential names that must be present in IngestionConfig for this
    /// source to run. Missing credentials skip the source.
    virtual std::vector<std::string> requiredCredentials() const { return {}; }

    /// Emit edges for `persons`.
    virtual void extract(const std::vector<Person>& persons,
                         const IngestionConfig& config,
                         const StrengthModel& model,
                         EdgeEmitter& out) const = 0;
};

} // namespace warmpath
