#pragma once

#include "ingest/extractor_base.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace warmpath {

class ExtractorRegistry;

/// People who worked at the same (canonical) company.
class CoworkerExtractor : public RelationshipExtractor {
public:
    std::string name() const override { return "coworker"; }
    RelationshipType type() const override { return RelationshipType::Coworker; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;
};

/// People who attended the same school.
class EducationExtractor : public RelationshipExtractor {
public:
    std::string name() const override { return "education"; }
    RelationshipType type() const override { return RelationshipType::Education; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;
};

/// Members of the same organization chapter (fraternities, clubs, boards).
class AffiliationExtractor : public RelationshipExtractor {
public:
    std::string name() const override { return "affiliation"; }
    RelationshipType type() const override { return RelationshipType::Affiliation; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;
};

/// People sharing a hometown (city + region).
class HometownExtractor : public RelationshipExtractor {
public:
    std::string name() const override { return "hometown"; }
    RelationshipType type() const override { return RelationshipType::Hometown; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;
};

/// Explicit family records, plus a surname + shared hometown heuristic.
class FamilyExtractor : public RelationshipExtractor {
public:
    std::string name() const override { return "family"; }
    RelationshipType type() const override { return RelationshipType::Family; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;
};

/// Links between social-platform handles. Optionally gated on credentials
/// for the platform APIs that supplied the evidence.
class SocialTieExtractor : public RelationshipExtractor {
public:
    explicit SocialTieExtractor(std::vector<std::string> required_credentials = {})
        : required_(std::move(required_credentials)) {}

    std::string name() const override { return "social"; }
    RelationshipType type() const override { return RelationshipType::Social; }
    std::vector<std::string> requiredCredentials() const override { return required_; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;

private:
    std::vector<std::string> required_;
};

/// Demo-data generator: random social ties between people at different
/// companies. Seeded, so reruns are identical. Never registered by default.
class SampledTieExtractor : public RelationshipExtractor {
public:
    SampledTieExtractor(double probability, uint64_t seed)
        : probability_(probability), seed_(seed) {}

    std::string name() const override { return "sampled-social"; }
    RelationshipType type() const override { return RelationshipType::Social; }
    void extract(const std::vector<Person>& persons, const IngestionConfig& config,
                 const StrengthModel& model, EdgeEmitter& out) const override;

private:
    double probability_;
    uint64_t seed_;
};

/// Register the six deterministic built-ins.
void registerDefaultExtractors(ExtractorRegistry& registry);

} // namespace warmpath
