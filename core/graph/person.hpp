#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace warmpath {

using PersonId = std::string;

// ─── Evidence records ──────────────────────────────────────────
// Raw relationship evidence attached to a person. Ingestion groups
// people by these records; nothing here is derived.

struct Employment {
    std::string company;
    std::string title;
    int start_year = 0;  // 0 = unknown
    int end_year = 0;    // 0 = unknown or current
};

struct Education {
    std::string school;
    std::string degree;
    int graduation_year = 0;
};

struct Affiliation {
    std::string organization;
    std::string chapter;
    std::string role;
};

struct Hometown {
    std::string city;
    std::string region;
    std::string country;
};

struct FamilyTie {
    std::string name;      // full name of the relative
    std::string relation;  // "sibling", "parent", ...
};

struct SocialProfile {
    std::string platform;
    std::string handle;
    std::vector<std::string> connections;  // handles on the same platform
};

/// A person in the professional network. Verified people own an account;
/// ghosts are placeholders inferred from evidence.
struct Person {
    PersonId id;
    std::string name;
    std::string company;
    std::string title;
    std::string location;

    std::vector<Employment> employment;
    std::vector<Education> education;
    std::vector<Affiliation> affiliations;
    std::vector<Hometown> hometowns;
    std::vector<FamilyTie> family;
    std::vector<SocialProfile> social_profiles;
    std::vector<std::string> skills;

    bool verified = true;
    bool activated = false;  // promoted from ghost through an invitation
    int trust_score = 70;

    std::unordered_map<std::string, std::string> metadata;

    Person() = default;
    Person(PersonId id, std::string name)
        : id(std::move(id)), name(std::move(name)) {}

    bool isGhost() const { return !verified; }

    void setAttribute(const std::string& key, const std::string& value) {
        metadata[key] = value;
    }

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = metadata.find(key);
        return it != metadata.end() ? it->second : default_val;
    }
};

/// Ghosts start with low trust.
constexpr int kGhostTrustScore = 20;

/// Build a ghost placeholder.
inline Person makeGhost(PersonId id, std::string name) {
    Person p(std::move(id), std::move(name));
    p.verified = false;
    p.trust_score = kGhostTrustScore;
    return p;
}

} // namespace warmpath
