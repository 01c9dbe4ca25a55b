#include "service/warmpath_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace warmpath {

namespace {

constexpr size_t kTopCompanies = 10;

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/// Clears the in-progress flag when a rebuild leaves scope.
class RebuildFlag {
public:
    explicit RebuildFlag(std::atomic<bool>& flag) : flag_(flag) {}
    ~RebuildFlag() { flag_.store(false); }
    RebuildFlag(const RebuildFlag&) = delete;
    RebuildFlag& operator=(const RebuildFlag&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

WarmPathService::WarmPathService(EvidenceStore& store,
                                 EngineConfig config,
                                 ExtractorRegistry registry,
                                 Notifier* notifier,
                                 Clock clock)
    : store_(store),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : systemClock()),
      engine_(store_, std::move(registry), config_.ingestion),
      finder_(config_.path),
      matcher_(config_.match),
      owned_notifier_(notifier ? nullptr : std::make_unique<LogNotifier>()),
      invitations_(store_, engine_, notifier ? *notifier : *owned_notifier_,
                   config_.invite, clock_) {}

// ─── Graph lifecycle ───────────────────────────────────────────

GraphStats WarmPathService::rebuildGraph() {
    bool expected = false;
    if (!rebuilding_.compare_exchange_strong(expected, true)) {
        spdlog::info("[WarmPath] Rebuild already in progress, returning previous stats");
        return stats();
    }
    RebuildFlag flag(rebuilding_);
    std::lock_guard<std::mutex> lock(write_mutex_);
    return runRebuild();
}

GraphStats WarmPathService::forceRebuild() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    rebuilding_.store(true);
    RebuildFlag flag(rebuilding_);
    return runRebuild();
}

bool WarmPathService::shouldRebuild() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!last_stats_.last_rebuild) return true;
    return clock_() - *last_stats_.last_rebuild >= config_.rebuild_interval;
}

GraphStats WarmPathService::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

GraphStats WarmPathService::runRebuild() {
    spdlog::info("[WarmPath] Rebuilding relationship graph");

    IngestionReport report = engine_.run();
    snapshot_.publish(report.persons, report.edges);
    auto index = snapshot_.current();

    GraphStats s = summarize(*index);
    s.relationship_breakdown = report.edges_by_type;
    s.last_rebuild = clock_();
    s.orphaned_edges = report.previous_orphaned;
    s.duplicate_edges = report.previous_duplicates;
    s.changed_edges = report.changed_edges;
    s.skipped_sources = report.sources_skipped;
    s.elapsed_seconds = report.elapsed_seconds;

    spdlog::info("[WarmPath] Graph generation {}: {} people ({} ghosts), {} edges",
                 s.generation, s.nodes, s.ghost_count, s.edges);
    for (const auto& [type, count] : s.relationship_breakdown) {
        spdlog::info("[WarmPath]   {}: {}", type, count);
    }
    for (size_t i = 0; i < s.company_breakdown.size() && i < 5; i++) {
        spdlog::info("[WarmPath]   top company {}: {} people",
                     s.company_breakdown[i].first, s.company_breakdown[i].second);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_stats_ = s;
    return s;
}

void WarmPathService::reindex() {
    snapshot_.publish(store_.loadPersons(), store_.loadEdges());
    auto index = snapshot_.current();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    GraphStats refreshed = summarize(*index);
    last_stats_.nodes = refreshed.nodes;
    last_stats_.edges = refreshed.edges;
    last_stats_.ghost_count = refreshed.ghost_count;
    last_stats_.company_breakdown = refreshed.company_breakdown;
    last_stats_.generation = refreshed.generation;
}

GraphStats WarmPathService::summarize(const GraphIndex& index) const {
    GraphStats s;
    s.nodes = index.personCount();
    s.edges = index.edgeCount();
    s.generation = index.generation();

    std::map<std::string, size_t> companies;
    index.forEachPerson([&](const Person& p) {
        if (p.isGhost()) s.ghost_count++;
        if (!p.company.empty()) companies[p.company]++;
    });

    s.company_breakdown.assign(companies.begin(), companies.end());
    std::stable_sort(s.company_breakdown.begin(), s.company_breakdown.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (s.company_breakdown.size() > kTopCompanies) {
        s.company_breakdown.resize(kTopCompanies);
    }
    return s;
}

// ─── Discovery ─────────────────────────────────────────────────

PathResult WarmPathService::findConnections(const PersonId& source,
                                            const PersonId& target,
                                            std::optional<int> max_hops) const {
    auto index = snapshot_.current();
    return finder_.find(*index, source, target, max_hops);
}

PathResult WarmPathService::findConnectionsToAny(const PersonId& source,
                                                 const std::vector<PersonId>& targets,
                                                 std::optional<int> max_hops) const {
    auto index = snapshot_.current();
    return finder_.findToAny(*index, source, targets, max_hops);
}

MatchResult WarmPathService::resolveTarget(const std::string& name,
                                           const std::string& company,
                                           const std::string& title,
                                           std::optional<PersonId> requester) const {
    MatchQuery query;
    query.name = name;
    query.company = company;
    query.title = title;
    query.requester = std::move(requester);

    auto index = snapshot_.current();
    return matcher_.resolve(*index, query);
}

PathResult WarmPathService::findIntroductionPaths(const PersonId& source,
                                                  const MatchQuery& target,
                                                  std::optional<int> max_hops) const {
    // One snapshot for both steps so matches and paths agree.
    auto index = snapshot_.current();

    MatchQuery query = target;
    query.requester = source;
    MatchResult matches = matcher_.resolve(*index, query);

    if (!matches.found) {
        PathResult result;
        result.status = PathStatus::TargetNotFound;
        result.message = matches.strategy;
        return result;
    }

    std::vector<PersonId> targets;
    for (const auto& m : matches.matches) targets.push_back(m.person_id);
    return finder_.findToAny(*index, source, targets, max_hops);
}

// ─── Invitations ───────────────────────────────────────────────

InvitationReceipt WarmPathService::createInvitation(const PersonId& ghost_id,
                                                    const PersonId& requester_id,
                                                    const PersonId& target_id) {
    return invitations_.create(ghost_id, requester_id, target_id);
}

ActivationResult WarmPathService::activateProfile(const std::string& token,
                                                  const ActivationData& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ActivationResult result = invitations_.activate(token, data);
    if (!result.success) {
        spdlog::info("[WarmPath] Activation rejected: {}", result.message);
        return result;
    }

    try {
        reindex();
    } catch (const StoreError& e) {
        // The promotion is committed; the next rebuild publishes it.
        spdlog::error("[WarmPath] Re-index after activating {} failed: {}",
                      *result.user_id, e.what());
    }
    return result;
}

size_t WarmPathService::expireInvitations(std::optional<TimePoint> now) {
    return invitations_.expireInvitations(now);
}

InvitationStats WarmPathService::invitationStats() const {
    return invitations_.stats();
}

} // namespace warmpath
