#pragma once

#include "store/evidence_store.hpp"

#include <map>
#include <mutex>
#include <unordered_map>

namespace warmpath {

/// Thread-safe in-process EvidenceStore.
/// People are kept ordered by id so loadPersons() is deterministic.
/// Methods are virtual overrides, so tests can inject failures by
/// subclassing.
class MemoryStore : public EvidenceStore {
public:
    MemoryStore() = default;

    std::vector<Person> loadPersons() const override;
    std::optional<Person> findPerson(const PersonId& id) const override;
    void upsertPerson(const Person& person) override;
    bool promoteGhost(const PersonId& id, int trust_floor,
                      const std::unordered_map<std::string, std::string>& profile) override;

    std::vector<Relationship> loadEdges() const override;
    void replaceEdges(std::vector<Relationship> edges) override;
    size_t updateEdgesTouching(const PersonId& id,
                               const std::function<void(Relationship&)>& fn) override;

    void insertInvitation(const Invitation& invitation) override;
    std::optional<Invitation> findInvitation(const std::string& id) const override;
    std::optional<Invitation> findInvitationByToken(const std::string& token) const override;
    std::vector<Invitation> listInvitations() const override;
    bool transitionInvitation(const std::string& id,
                              InvitationStatus expected,
                              InvitationStatus next,
                              TimePoint at) override;
    void recordNotification(const std::string& id, bool sent,
                            const std::string& error) override;

    size_t personCount() const;
    size_t edgeCount() const;

private:
    mutable std::mutex mutex_;
    std::map<PersonId, Person> persons_;
    std::vector<Relationship> edges_;
    std::map<std::string, Invitation> invitations_;
    std::unordered_map<std::string, std::string> token_index_;  // token → invitation id
};

} // namespace warmpath
