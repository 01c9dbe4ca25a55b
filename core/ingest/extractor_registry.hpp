#pragma once

#include "ingest/extractor_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace warmpath {

/// Registry for evidence extractors.
/// Extractors run in registration order; the result does not depend on
/// that order because the emitter keys edges by (from, to, type).
class ExtractorRegistry {
public:
    /// Registry holding the six built-in deterministic extractors.
    static ExtractorRegistry withDefaults();

    /// Register an extractor (takes ownership). Replaces an existing
    /// extractor with the same name.
    void registerExtractor(std::unique_ptr<RelationshipExtractor> extractor);

    /// Remove an extractor by name. Returns true if found.
    bool remove(const std::string& name);

    /// All extractors whose required credentials are present.
    std::vector<const RelationshipExtractor*> getRunnable(const IngestionConfig& config) const;

    /// Extractors skipped for missing credentials.
    std::vector<const RelationshipExtractor*> getSkipped(const IngestionConfig& config) const;

    std::vector<const RelationshipExtractor*> getAll() const;
    const RelationshipExtractor* getByName(const std::string& name) const;

    size_t count() const { return extractors_.size(); }

private:
    static bool isRunnable(const RelationshipExtractor& e, const IngestionConfig& config);
    void rebuildIndex();

    std::vector<std::unique_ptr<RelationshipExtractor>> extractors_;
    std::unordered_map<std::string, size_t> name_index_;
};

} // namespace warmpath
