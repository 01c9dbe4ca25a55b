#include "ingest/extractor_base.hpp"

namespace warmpath {

bool EdgeEmitter::emit(const PersonId& a, const PersonId& b, RelationshipType type,
                       int strength, const std::map<std::string, std::string>& metadata) {
    if (a == b) return false;
    put(a, b, type, strength, metadata);
    put(b, a, type, strength, metadata);
    return true;
}

void EdgeEmitter::put(const PersonId& from, const PersonId& to, RelationshipType type,
                      int strength, const std::map<std::string, std::string>& metadata) {
    auto key = std::make_tuple(from, to, type);
    auto it = edges_.find(key);
    if (it != edges_.end() && it->second.strength >= strength) return;

    Relationship e(from, to, type, strength, 0);
    e.metadata = metadata;
    edges_[key] = std::move(e);
}

std::vector<Relationship> EdgeEmitter::edges() const {
    std::vector<Relationship> result;
    result.reserve(edges_.size());
    for (const auto& [_, e] : edges_) {
        result.push_back(e);
    }
    return result;
}

size_t EdgeEmitter::countOf(RelationshipType type) const {
    size_t n = 0;
    for (const auto& [key, _] : edges_) {
        if (std::get<2>(key) == type) n++;
    }
    return n;
}

} // namespace warmpath
