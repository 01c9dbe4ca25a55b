#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"
#include "invite/invitation.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace warmpath {

/// The store could not be read or written. Callers treat it as transient:
/// nothing was changed by the failing call.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── EvidenceStore ─────────────────────────────────────────────
// Durable record of people, their raw evidence, the derived edge set
// and invitations. The engine only reads people and evidence and writes
// normalized edges, person promotions and invitation state.
//
// Every method is atomic with respect to the others. Implementations
// throw StoreError when the backing store is unreachable.

class EvidenceStore {
public:
    virtual ~EvidenceStore() = default;

    // ── People ──
    virtual std::vector<Person> loadPersons() const = 0;
    virtual std::optional<Person> findPerson(const PersonId& id) const = 0;
    virtual void upsertPerson(const Person& person) = 0;

    /// Flip a ghost to verified, raise trust to at least `trust_floor`,
    /// mark it activated and merge `profile` into its metadata.
    /// Returns false if the person is unknown or already verified.
    virtual bool promoteGhost(const PersonId& id, int trust_floor,
                              const std::unordered_map<std::string, std::string>& profile) = 0;

    // ── Edges ──
    virtual std::vector<Relationship> loadEdges() const = 0;

    /// Replace the whole edge set. Either every edge is replaced or, on
    /// StoreError, the previous set is left untouched.
    virtual void replaceEdges(std::vector<Relationship> edges) = 0;

    /// Apply `fn` to every edge touching `id`. Returns the number of
    /// edges visited.
    virtual size_t updateEdgesTouching(const PersonId& id,
                                       const std::function<void(Relationship&)>& fn) = 0;

    // ── Invitations ──

    /// Throws StoreError if the id or token already exists.
    virtual void insertInvitation(const Invitation& invitation) = 0;
    virtual std::optional<Invitation> findInvitation(const std::string& id) const = 0;
    virtual std::optional<Invitation> findInvitationByToken(const std::string& token) const = 0;
    virtual std::vector<Invitation> listInvitations() const = 0;

    /// Compare-and-set on invitation status: moves `id` to `next` only if
    /// its status is still `expected`. Returns whether the move happened.
    virtual bool transitionInvitation(const std::string& id,
                                      InvitationStatus expected,
                                      InvitationStatus next,
                                      TimePoint at) = 0;

    virtual void recordNotification(const std::string& id, bool sent,
                                    const std::string& error) = 0;
};

} // namespace warmpath
