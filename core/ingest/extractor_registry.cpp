#include "ingest/extractor_registry.hpp"
#include "ingest/default_extractors.hpp"

#include <cstddef>

namespace warmpath {

ExtractorRegistry ExtractorRegistry::withDefaults() {
    ExtractorRegistry registry;
    registerDefaultExtractors(registry);
    return registry;
}

void ExtractorRegistry::registerExtractor(std::unique_ptr<RelationshipExtractor> extractor) {
    if (!extractor) return;
    std::string n = extractor->name();
    auto it = name_index_.find(n);
    if (it != name_index_.end()) {
        extractors_[it->second] = std::move(extractor);
        return;
    }
    name_index_[n] = extractors_.size();
    extractors_.push_back(std::move(extractor));
}

bool ExtractorRegistry::remove(const std::string& name) {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) return false;

    extractors_.erase(extractors_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildIndex();
    return true;
}

void ExtractorRegistry::rebuildIndex() {
    name_index_.clear();
    for (size_t i = 0; i < extractors_.size(); i++) {
        name_index_[extractors_[i]->name()] = i;
    }
}

bool ExtractorRegistry::isRunnable(const RelationshipExtractor& e, const IngestionConfig& config) {
    for (const auto& cred : e.requiredCredentials()) {
        if (!config.hasCredential(cred)) return false;
    }
    return true;
}

std::vector<const RelationshipExtractor*> ExtractorRegistry::getRunnable(const IngestionConfig& config) const {
    std::vector<const RelationshipExtractor*> result;
    for (const auto& e : extractors_) {
        if (isRunnable(*e, config)) result.push_back(e.get());
    }
    return result;
}

std::vector<const RelationshipExtractor*> ExtractorRegistry::getSkipped(const IngestionConfig& config) const {
    std::vector<const RelationshipExtractor*> result;
    for (const auto& e : extractors_) {
        if (!isRunnable(*e, config)) result.push_back(e.get());
    }
    return result;
}

std::vector<const RelationshipExtractor*> ExtractorRegistry::getAll() const {
    std::vector<const RelationshipExtractor*> result;
    for (const auto& e : extractors_) {
        result.push_back(e.get());
    }
    return result;
}

const RelationshipExtractor* ExtractorRegistry::getByName(const std::string& name) const {
    auto it = name_index_.find(name);
    return it != name_index_.end() ? extractors_[it->second].get() : nullptr;
}

} // namespace warmpath
