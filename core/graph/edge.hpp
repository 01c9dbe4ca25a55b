#pragma once

#include "graph/person.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace warmpath {

enum class RelationshipType {
    Coworker,
    Education,
    Family,
    Affiliation,
    Hometown,
    Social
};

constexpr RelationshipType kAllRelationshipTypes[] = {
    RelationshipType::Coworker, RelationshipType::Education,
    RelationshipType::Family, RelationshipType::Affiliation,
    RelationshipType::Hometown, RelationshipType::Social
};

std::string toString(RelationshipType type);
std::optional<RelationshipType> relationshipTypeFromString(const std::string& s);

/// Trust rank used for tie-breaking: higher means a more reliable
/// introduction channel.
int trustRank(RelationshipType type);

/// Coworker, education and family ties.
bool isHighTrust(RelationshipType type);

/// A directed, typed, weighted edge between two people.
/// Ingestion always emits both directions; (from, to, type) identifies it.
struct Relationship {
    PersonId from;
    PersonId to;
    RelationshipType type = RelationshipType::Social;
    int strength = 0;     // [0, 100]
    int confidence = 0;   // [0, 100]
    std::map<std::string, std::string> metadata;

    Relationship() = default;
    Relationship(PersonId from, PersonId to, RelationshipType type, int strength, int confidence = 100)
        : from(std::move(from)), to(std::move(to)), type(type),
          strength(strength), confidence(confidence) {}

    bool touches(const PersonId& id) const { return from == id || to == id; }

    auto key() const { return std::tie(from, to, type); }
};

inline bool operator==(const Relationship& a, const Relationship& b) {
    return a.from == b.from && a.to == b.to && a.type == b.type &&
           a.strength == b.strength && a.confidence == b.confidence &&
           a.metadata == b.metadata;
}

inline bool operator!=(const Relationship& a, const Relationship& b) {
    return !(a == b);
}

} // namespace warmpath
