#pragma once

#include "config/engine_config.hpp"
#include "graph/index_snapshot.hpp"
#include "ingest/extractor_registry.hpp"
#include "ingest/ingestion_engine.hpp"
#include "invite/invitation_service.hpp"
#include "invite/notifier.hpp"
#include "match/identity_matcher.hpp"
#include "path/path_finder.hpp"
#include "store/evidence_store.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warmpath {

/// Summary of the current graph generation.
struct GraphStats {
    size_t nodes = 0;
    size_t edges = 0;                                   // directed
    std::map<std::string, size_t> relationship_breakdown;
    std::vector<std::pair<std::string, size_t>> company_breakdown;  // largest first
    std::optional<TimePoint> last_rebuild;
    uint64_t generation = 0;

    size_t ghost_count = 0;
    size_t orphaned_edges = 0;     // found in the replaced generation
    size_t duplicate_edges = 0;    // found in the replaced generation
    size_t changed_edges = 0;
    std::vector<std::string> skipped_sources;
    double elapsed_seconds = 0.0;
};

// ─── WarmPathService ───────────────────────────────────────────
// Entry point for application code. Owns the ingestion engine, the
// published Graph Index, path discovery, identity matching and the
// invitation lifecycle, all bound to one caller-owned EvidenceStore.
//
// Reads (findConnections, resolveTarget) run lock-free against the
// current snapshot. Writers that change the edge set (rebuilds and
// activations) are serialized.

class WarmPathService {
public:
    /// `notifier` may be null, in which case invitations are logged.
    WarmPathService(EvidenceStore& store,
                    EngineConfig config = EngineConfig(),
                    ExtractorRegistry registry = ExtractorRegistry::withDefaults(),
                    Notifier* notifier = nullptr,
                    Clock clock = nullptr);

    WarmPathService(const WarmPathService&) = delete;
    WarmPathService& operator=(const WarmPathService&) = delete;

    // ── Graph lifecycle ──

    /// Re-derive every edge and publish a new Graph Index. If a rebuild
    /// is already running, returns the last completed stats instead.
    /// Throws IngestionError if ingestion aborts; the previous graph stays.
    GraphStats rebuildGraph();

    /// Like rebuildGraph() but waits for a running rebuild and then
    /// rebuilds again.
    GraphStats forceRebuild();

    /// True before the first rebuild or once rebuild_interval has passed.
    bool shouldRebuild() const;

    GraphStats stats() const;
    bool rebuilding() const { return rebuilding_.load(); }

    std::shared_ptr<const GraphIndex> snapshot() const { return snapshot_.current(); }

    // ── Discovery ──

    PathResult findConnections(const PersonId& source,
                               const PersonId& target,
                               std::optional<int> max_hops = std::nullopt) const;

    PathResult findConnectionsToAny(const PersonId& source,
                                    const std::vector<PersonId>& targets,
                                    std::optional<int> max_hops = std::nullopt) const;

    MatchResult resolveTarget(const std::string& name,
                              const std::string& company = "",
                              const std::string& title = "",
                              std::optional<PersonId> requester = std::nullopt) const;

    /// Resolve a free-text target, then find paths from `source` to any
    /// of the matched people.
    PathResult findIntroductionPaths(const PersonId& source,
                                     const MatchQuery& target,
                                     std::optional<int> max_hops = std::nullopt) const;

    // ── Invitations ──

    InvitationReceipt createInvitation(const PersonId& ghost_id,
                                       const PersonId& requester_id,
                                       const PersonId& target_id);

    ActivationResult activateProfile(const std::string& token, const ActivationData& data);

    size_t expireInvitations(std::optional<TimePoint> now = std::nullopt);
    InvitationStats invitationStats() const;

    const EngineConfig& config() const { return config_; }

private:
    GraphStats runRebuild();
    void reindex();
    GraphStats summarize(const GraphIndex& index) const;

    EvidenceStore& store_;
    EngineConfig config_;
    Clock clock_;
    IngestionEngine engine_;
    IndexSnapshot snapshot_;
    PathFinder finder_;
    IdentityMatcher matcher_;
    std::unique_ptr<Notifier> owned_notifier_;
    InvitationService invitations_;

    std::atomic<bool> rebuilding_{false};
    std::mutex write_mutex_;            // rebuilds and activation reweighting
    mutable std::mutex stats_mutex_;
    GraphStats last_stats_;
};

} // namespace warmpath
