#include "ingest/ingestion_engine.hpp"
#include "graph/edge_diff.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace warmpath {

IngestionEngine::IngestionEngine(EvidenceStore& store, ExtractorRegistry registry, IngestionConfig config)
    : store_(store),
      registry_(std::move(registry)),
      config_(std::move(config)),
      model_(config_) {}

std::vector<Relationship> IngestionEngine::derive(const std::vector<Person>& persons,
                                                  std::vector<std::string>* sources_run,
                                                  std::vector<std::string>* sources_skipped) const {
    for (const auto* skipped : registry_.getSkipped(config_)) {
        spdlog::warn("[Ingestion] Skipping evidence source '{}': missing credentials", skipped->name());
        if (sources_skipped) sources_skipped->push_back(skipped->name());
    }

    EdgeEmitter emitter;
    for (const auto* extractor : registry_.getRunnable(config_)) {
        size_t before = emitter.size();
        extractor->extract(persons, config_, model_, emitter);
        spdlog::debug("[Ingestion] {} produced {} directed edges",
                      extractor->name(), emitter.size() - before);
        if (sources_run) sources_run->push_back(extractor->name());
    }

    std::unordered_map<PersonId, const Person*> by_id;
    by_id.reserve(persons.size());
    for (const auto& p : persons) by_id.emplace(p.id, &p);

    std::vector<Relationship> edges = emitter.edges();
    for (auto& e : edges) {
        auto a = by_id.find(e.from);
        auto b = by_id.find(e.to);
        if (a == by_id.end() || b == by_id.end()) {
            throw IngestionError("Extractor emitted an edge for an unknown person: " +
                                 e.from + " -> " + e.to);
        }
        e.confidence = model_.confidence(*a->second, *b->second);
    }
    return edges;
}

IngestionReport IngestionEngine::run() {
    auto start = std::chrono::steady_clock::now();
    IngestionReport report;

    std::vector<Relationship> previous;
    try {
        report.persons = store_.loadPersons();
        previous = store_.loadEdges();
    } catch (const StoreError& e) {
        spdlog::error("[Ingestion] Evidence store unreadable, keeping existing edges: {}", e.what());
        throw IngestionError(std::string("Evidence store unreadable: ") + e.what());
    }

    spdlog::info("[Ingestion] Loaded {} persons, {} existing edges",
                 report.persons.size(), previous.size());

    try {
        report.edges = derive(report.persons, &report.sources_run, &report.sources_skipped);
    } catch (const IngestionError& e) {
        spdlog::error("[Ingestion] Aborted, keeping existing edges: {}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[Ingestion] Extractor failed, keeping existing edges: {}", e.what());
        throw IngestionError(std::string("Extractor failed: ") + e.what());
    }

    // Data-integrity check on the generation being replaced.
    std::unordered_set<PersonId> ids;
    for (const auto& p : report.persons) {
        ids.insert(p.id);
        if (p.isGhost()) report.ghost_count++;
    }
    for (const auto& e : previous) {
        if (!ids.count(e.from) || !ids.count(e.to)) report.previous_orphaned++;
    }
    report.previous_duplicates = EdgeSetDiff::duplicates(previous).size();
    report.changed_edges = EdgeSetDiff::diff(previous, report.edges).size();

    if (report.previous_orphaned > 0) {
        spdlog::warn("[Ingestion] Previous generation had {} orphaned edges", report.previous_orphaned);
    }
    if (report.previous_duplicates > 0) {
        spdlog::warn("[Ingestion] Previous generation had {} duplicate edges", report.previous_duplicates);
    }

    try {
        store_.replaceEdges(report.edges);
    } catch (const StoreError& e) {
        spdlog::error("[Ingestion] Failed to persist edge set: {}", e.what());
        throw IngestionError(std::string("Failed to persist edge set: ") + e.what());
    }

    for (RelationshipType t : kAllRelationshipTypes) {
        report.edges_by_type[toString(t)] = 0;
    }
    for (const auto& e : report.edges) {
        report.edges_by_type[toString(e.type)]++;
    }

    report.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    spdlog::info("[Ingestion] Committed {} edges ({} changed) from {} sources in {:.3f}s",
                 report.edges.size(), report.changed_edges,
                 report.sources_run.size(), report.elapsed_seconds);
    return report;
}

size_t IngestionEngine::refreshConfidence(const PersonId& id) {
    auto subject = store_.findPerson(id);
    if (!subject) return 0;

    // Resolve endpoints first; the store must not be re-entered from
    // inside updateEdgesTouching().
    std::unordered_map<PersonId, Person> endpoints;
    endpoints.emplace(id, *subject);
    for (const auto& e : store_.loadEdges()) {
        if (!e.touches(id)) continue;
        const PersonId& other = e.from == id ? e.to : e.from;
        if (endpoints.count(other)) continue;
        if (auto p = store_.findPerson(other)) endpoints.emplace(other, *p);
    }

    size_t updated = store_.updateEdgesTouching(id, [&](Relationship& e) {
        auto a = endpoints.find(e.from);
        auto b = endpoints.find(e.to);
        if (a == endpoints.end() || b == endpoints.end()) return;
        e.confidence = model_.confidence(a->second, b->second);
    });

    spdlog::info("[Ingestion] Refreshed confidence on {} edges touching {}", updated, id);
    return updated;
}

} // namespace warmpath
