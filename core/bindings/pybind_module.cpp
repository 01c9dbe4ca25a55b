// PyBind11 bindings for the warmpath core.
// Exposes the evidence store, graph service, path results, identity
// matches and invitations to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DWARMPATH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "graph/person.hpp"
#include "graph/edge.hpp"
#include "store/memory_store.hpp"
#include "path/path_state.hpp"
#include "match/identity_matcher.hpp"
#include "invite/invitation.hpp"
#include "config/engine_config.hpp"
#include "service/warmpath_service.hpp"
#include "util/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(warmpath_bindings, m) {
    m.doc() = "Warm-introduction path engine";

    py::register_exception<warmpath::StoreError>(m, "StoreError");
    py::register_exception<warmpath::IngestionError>(m, "IngestionError");
    py::register_exception<warmpath::InvitationError>(m, "InvitationError");
    py::register_exception<warmpath::ConfigError>(m, "ConfigError");

    // ── Evidence records ──
    py::class_<warmpath::Employment>(m, "Employment")
        .def(py::init<>())
        .def_readwrite("company",    &warmpath::Employment::company)
        .def_readwrite("title",      &warmpath::Employment::title)
        .def_readwrite("start_year", &warmpath::Employment::start_year)
        .def_readwrite("end_year",   &warmpath::Employment::end_year);

    py::class_<warmpath::Education>(m, "Education")
        .def(py::init<>())
        .def_readwrite("school",          &warmpath::Education::school)
        .def_readwrite("degree",          &warmpath::Education::degree)
        .def_readwrite("graduation_year", &warmpath::Education::graduation_year);

    py::class_<warmpath::Affiliation>(m, "Affiliation")
        .def(py::init<>())
        .def_readwrite("organization", &warmpath::Affiliation::organization)
        .def_readwrite("chapter",      &warmpath::Affiliation::chapter)
        .def_readwrite("role",         &warmpath::Affiliation::role);

    py::class_<warmpath::Hometown>(m, "Hometown")
        .def(py::init<>())
        .def_readwrite("city",    &warmpath::Hometown::city)
        .def_readwrite("region",  &warmpath::Hometown::region)
        .def_readwrite("country", &warmpath::Hometown::country);

    py::class_<warmpath::FamilyTie>(m, "FamilyTie")
        .def(py::init<>())
        .def_readwrite("name",     &warmpath::FamilyTie::name)
        .def_readwrite("relation", &warmpath::FamilyTie::relation);

    py::class_<warmpath::SocialProfile>(m, "SocialProfile")
        .def(py::init<>())
        .def_readwrite("platform",    &warmpath::SocialProfile::platform)
        .def_readwrite("handle",      &warmpath::SocialProfile::handle)
        .def_readwrite("connections", &warmpath::SocialProfile::connections);

    // ── Person ──
    py::class_<warmpath::Person>(m, "Person")
        .def(py::init<>())
        .def(py::init<warmpath::PersonId, std::string>())
        .def_readwrite("id",              &warmpath::Person::id)
        .def_readwrite("name",            &warmpath::Person::name)
        .def_readwrite("company",         &warmpath::Person::company)
        .def_readwrite("title",           &warmpath::Person::title)
        .def_readwrite("location",        &warmpath::Person::location)
        .def_readwrite("employment",      &warmpath::Person::employment)
        .def_readwrite("education",       &warmpath::Person::education)
        .def_readwrite("affiliations",    &warmpath::Person::affiliations)
        .def_readwrite("hometowns",       &warmpath::Person::hometowns)
        .def_readwrite("family",          &warmpath::Person::family)
        .def_readwrite("social_profiles", &warmpath::Person::social_profiles)
        .def_readwrite("skills",          &warmpath::Person::skills)
        .def_readwrite("verified",        &warmpath::Person::verified)
        .def_readwrite("activated",       &warmpath::Person::activated)
        .def_readwrite("trust_score",     &warmpath::Person::trust_score)
        .def_readwrite("metadata",        &warmpath::Person::metadata)
        .def("is_ghost", &warmpath::Person::isGhost);

    m.def("make_ghost", &warmpath::makeGhost, py::arg("id"), py::arg("name"));

    // ── Relationship ──
    py::enum_<warmpath::RelationshipType>(m, "RelationshipType")
        .value("COWORKER",    warmpath::RelationshipType::Coworker)
        .value("EDUCATION",   warmpath::RelationshipType::Education)
        .value("FAMILY",      warmpath::RelationshipType::Family)
        .value("AFFILIATION", warmpath::RelationshipType::Affiliation)
        .value("HOMETOWN",    warmpath::RelationshipType::Hometown)
        .value("SOCIAL",      warmpath::RelationshipType::Social);

    py::class_<warmpath::Relationship>(m, "Relationship")
        .def(py::init<>())
        .def_readwrite("from_id",    &warmpath::Relationship::from)
        .def_readwrite("to_id",      &warmpath::Relationship::to)
        .def_readwrite("type",       &warmpath::Relationship::type)
        .def_readwrite("strength",   &warmpath::Relationship::strength)
        .def_readwrite("confidence", &warmpath::Relationship::confidence)
        .def_readwrite("metadata",   &warmpath::Relationship::metadata);

    // ── Evidence store ──
    py::class_<warmpath::EvidenceStore>(m, "EvidenceStore");

    py::class_<warmpath::MemoryStore, warmpath::EvidenceStore>(m, "MemoryStore")
        .def(py::init<>())
        .def("upsert_person", &warmpath::MemoryStore::upsertPerson)
        .def("find_person",   &warmpath::MemoryStore::findPerson)
        .def("load_persons",  &warmpath::MemoryStore::loadPersons)
        .def("load_edges",    &warmpath::MemoryStore::loadEdges)
        .def("person_count",  &warmpath::MemoryStore::personCount)
        .def("edge_count",    &warmpath::MemoryStore::edgeCount);

    // ── Paths ──
    py::class_<warmpath::PathHop>(m, "PathHop")
        .def_readonly("from_id",    &warmpath::PathHop::from)
        .def_readonly("to_id",      &warmpath::PathHop::to)
        .def_readonly("type",       &warmpath::PathHop::type)
        .def_readonly("strength",   &warmpath::PathHop::strength)
        .def_readonly("confidence", &warmpath::PathHop::confidence);

    py::class_<warmpath::Path>(m, "Path")
        .def_readonly("people",              &warmpath::Path::people)
        .def_readonly("hops",                &warmpath::Path::hops)
        .def_readonly("edge_types",          &warmpath::Path::edge_types)
        .def_readonly("score",               &warmpath::Path::score)
        .def_readonly("ghost_ids",           &warmpath::Path::ghost_ids)
        .def_readonly("requires_invitation", &warmpath::Path::requires_invitation)
        .def("hop_count", &warmpath::Path::hopCount);

    py::enum_<warmpath::PathStatus>(m, "PathStatus")
        .value("FOUND",                warmpath::PathStatus::Found)
        .value("NO_PATH_WITHIN_BOUND", warmpath::PathStatus::NoPathWithinBound)
        .value("SOURCE_NOT_FOUND",     warmpath::PathStatus::SourceNotFound)
        .value("TARGET_NOT_FOUND",     warmpath::PathStatus::TargetNotFound)
        .value("SAME_PERSON",          warmpath::PathStatus::SamePerson);

    py::class_<warmpath::PathResult>(m, "PathResult")
        .def_readonly("status",           &warmpath::PathResult::status)
        .def_readonly("paths",            &warmpath::PathResult::paths)
        .def_readonly("top_score",        &warmpath::PathResult::top_score)
        .def_readonly("max_hops",         &warmpath::PathResult::max_hops)
        .def_readonly("budget_exhausted", &warmpath::PathResult::budget_exhausted)
        .def_readonly("message",          &warmpath::PathResult::message)
        .def("found", &warmpath::PathResult::found);

    // ── Matches ──
    py::enum_<warmpath::MatchTier>(m, "MatchTier")
        .value("EXACT", warmpath::MatchTier::Exact)
        .value("FUZZY", warmpath::MatchTier::Fuzzy);

    py::class_<warmpath::RankedMatch>(m, "RankedMatch")
        .def_readonly("person_id",             &warmpath::RankedMatch::person_id)
        .def_readonly("name",                  &warmpath::RankedMatch::name)
        .def_readonly("company",               &warmpath::RankedMatch::company)
        .def_readonly("title",                 &warmpath::RankedMatch::title)
        .def_readonly("tier",                  &warmpath::RankedMatch::tier)
        .def_readonly("confidence",            &warmpath::RankedMatch::confidence)
        .def_readonly("is_ghost",              &warmpath::RankedMatch::is_ghost)
        .def_readonly("relationship_type",     &warmpath::RankedMatch::relationship_type)
        .def_readonly("relationship_strength", &warmpath::RankedMatch::relationship_strength)
        .def_readonly("strength_factors",      &warmpath::RankedMatch::strength_factors)
        .def_readonly("approach_strategy",     &warmpath::RankedMatch::approach_strategy);

    py::class_<warmpath::MatchResult>(m, "MatchResult")
        .def_readonly("found",    &warmpath::MatchResult::found)
        .def_readonly("matches",  &warmpath::MatchResult::matches)
        .def_readonly("strategy", &warmpath::MatchResult::strategy);

    // ── Invitations ──
    py::class_<warmpath::InvitationReceipt>(m, "InvitationReceipt")
        .def_readonly("invite_id",  &warmpath::InvitationReceipt::invite_id)
        .def_readonly("token",      &warmpath::InvitationReceipt::token)
        .def_readonly("email_sent", &warmpath::InvitationReceipt::email_sent);

    py::class_<warmpath::ActivationData>(m, "ActivationData")
        .def(py::init<>())
        .def_readwrite("email",        &warmpath::ActivationData::email)
        .def_readwrite("display_name", &warmpath::ActivationData::display_name)
        .def_readwrite("preferences",  &warmpath::ActivationData::preferences);

    py::class_<warmpath::ActivationResult>(m, "ActivationResult")
        .def_readonly("success", &warmpath::ActivationResult::success)
        .def_readonly("user_id", &warmpath::ActivationResult::user_id)
        .def_readonly("message", &warmpath::ActivationResult::message);

    py::class_<warmpath::InvitationStats>(m, "InvitationStats")
        .def_readonly("total",           &warmpath::InvitationStats::total)
        .def_readonly("sent",            &warmpath::InvitationStats::sent)
        .def_readonly("accepted",        &warmpath::InvitationStats::accepted)
        .def_readonly("expired",         &warmpath::InvitationStats::expired)
        .def_readonly("conversion_rate", &warmpath::InvitationStats::conversion_rate);

    // ── Service ──
    py::class_<warmpath::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("log_level", &warmpath::EngineConfig::log_level);

    py::class_<warmpath::GraphStats>(m, "GraphStats")
        .def_readonly("nodes",                  &warmpath::GraphStats::nodes)
        .def_readonly("edges",                  &warmpath::GraphStats::edges)
        .def_readonly("relationship_breakdown", &warmpath::GraphStats::relationship_breakdown)
        .def_readonly("company_breakdown",      &warmpath::GraphStats::company_breakdown)
        .def_readonly("last_rebuild",           &warmpath::GraphStats::last_rebuild)
        .def_readonly("ghost_count",            &warmpath::GraphStats::ghost_count)
        .def_readonly("skipped_sources",        &warmpath::GraphStats::skipped_sources);

    py::class_<warmpath::WarmPathService>(m, "WarmPathService")
        .def(py::init([](warmpath::EvidenceStore& store, const warmpath::EngineConfig& config) {
                 return std::make_unique<warmpath::WarmPathService>(store, config);
             }),
             py::arg("store"), py::arg("config") = warmpath::EngineConfig(),
             py::keep_alive<1, 2>())
        .def("rebuild_graph",  &warmpath::WarmPathService::rebuildGraph,
             py::call_guard<py::gil_scoped_release>())
        .def("force_rebuild",  &warmpath::WarmPathService::forceRebuild,
             py::call_guard<py::gil_scoped_release>())
        .def("should_rebuild", &warmpath::WarmPathService::shouldRebuild)
        .def("stats",          &warmpath::WarmPathService::stats)
        .def("find_connections", &warmpath::WarmPathService::findConnections,
             py::arg("source"), py::arg("target"), py::arg("max_hops") = py::none())
        .def("resolve_target", &warmpath::WarmPathService::resolveTarget,
             py::arg("name"), py::arg("company") = "", py::arg("title") = "",
             py::arg("requester") = py::none())
        .def("create_invitation", &warmpath::WarmPathService::createInvitation,
             py::arg("ghost_id"), py::arg("requester_id"), py::arg("target_id"))
        .def("activate_profile", &warmpath::WarmPathService::activateProfile,
             py::arg("token"), py::arg("data") = warmpath::ActivationData())
        .def("expire_invitations", [](warmpath::WarmPathService& self) {
            return self.expireInvitations();
        })
        .def("invitation_stats", &warmpath::WarmPathService::invitationStats);

    m.def("load_config", &warmpath::loadConfig, py::arg("path"));
    m.def("configure_logging", &warmpath::configureLogging, py::arg("level") = "info");
}
