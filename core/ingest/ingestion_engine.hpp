#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"
#include "ingest/extractor_registry.hpp"
#include "ingest/strength_model.hpp"
#include "store/evidence_store.hpp"

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace warmpath {

/// Ingestion was aborted. The previously persisted edge set is intact.
class IngestionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Outcome of one committed ingestion run.
struct IngestionReport {
    std::vector<Person> persons;        // evidence the edges were derived from
    std::vector<Relationship> edges;    // committed edge set, sorted by (from, to, type)
    std::map<std::string, size_t> edges_by_type;
    std::vector<std::string> sources_run;
    std::vector<std::string> sources_skipped;  // missing credentials
    size_t ghost_count = 0;
    size_t previous_orphaned = 0;       // previous generation, endpoint unknown
    size_t previous_duplicates = 0;     // previous generation, repeated (from, to, type)
    size_t changed_edges = 0;           // vs previous generation
    double elapsed_seconds = 0.0;
};

// ─── IngestionEngine ───────────────────────────────────────────
// Recomputes the complete edge set from the Evidence Store.
//
//   load persons → run extractors → assign confidence → replace edges
//
// A run is a single transaction against the edge set: if reading the
// store or any extractor fails, nothing is written and IngestionError
// is thrown. Running twice on unchanged evidence yields an identical
// edge set.

class IngestionEngine {
public:
    IngestionEngine(EvidenceStore& store, ExtractorRegistry registry, IngestionConfig config);

    /// Run a full ingestion. Throws IngestionError on abort.
    IngestionReport run();

    /// Derive the edge set for `persons` without touching the store.
    std::vector<Relationship> derive(const std::vector<Person>& persons,
                                     std::vector<std::string>* sources_run = nullptr,
                                     std::vector<std::string>* sources_skipped = nullptr) const;

    /// Recompute confidence for every stored edge touching `id` from the
    /// current state of its endpoints. Used after ghost activation in
    /// place of a full rebuild. Returns the number of edges updated.
    size_t refreshConfidence(const PersonId& id);

    const IngestionConfig& config() const { return config_; }
    const StrengthModel& model() const { return model_; }
    const ExtractorRegistry& registry() const { return registry_; }

private:
    EvidenceStore& store_;
    ExtractorRegistry registry_;
    IngestionConfig config_;
    StrengthModel model_;
};

} // namespace warmpath
