#include "graph/edge.hpp"

namespace warmpath {

std::string toString(RelationshipType type) {
    switch (type) {
        case RelationshipType::Coworker:    return "coworker";
        case RelationshipType::Education:   return "education";
        case RelationshipType::Family:      return "family";
        case RelationshipType::Affiliation: return "affiliation";
        case RelationshipType::Hometown:    return "hometown";
        case RelationshipType::Social:      return "social";
    }
    return "social";
}

std::optional<RelationshipType> relationshipTypeFromString(const std::string& s) {
    for (RelationshipType t : kAllRelationshipTypes) {
        if (toString(t) == s) return t;
    }
    // spellings used by older evidence feeds
    if (s == "school") return RelationshipType::Education;
    if (s == "fraternity" || s == "greek_life") return RelationshipType::Affiliation;
    return std::nullopt;
}

int trustRank(RelationshipType type) {
    switch (type) {
        case RelationshipType::Coworker:    return 5;
        case RelationshipType::Education:   return 4;
        case RelationshipType::Family:      return 3;
        case RelationshipType::Affiliation: return 2;
        case RelationshipType::Hometown:    return 1;
        case RelationshipType::Social:      return 0;
    }
    return 0;
}

bool isHighTrust(RelationshipType type) {
    return type == RelationshipType::Coworker ||
           type == RelationshipType::Education ||
           type == RelationshipType::Family;
}

} // namespace warmpath
