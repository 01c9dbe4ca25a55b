#include "store/memory_store.hpp"

#include <algorithm>

namespace warmpath {

// ─── People ────────────────────────────────────────────────────

std::vector<Person> MemoryStore::loadPersons() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Person> result;
    result.reserve(persons_.size());
    for (const auto& [_, p] : persons_) {
        result.push_back(p);
    }
    return result;
}

std::optional<Person> MemoryStore::findPerson(const PersonId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = persons_.find(id);
    if (it == persons_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::upsertPerson(const Person& person) {
    if (person.id.empty()) {
        throw StoreError("Person id must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    persons_[person.id] = person;
}

bool MemoryStore::promoteGhost(const PersonId& id, int trust_floor,
                               const std::unordered_map<std::string, std::string>& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = persons_.find(id);
    if (it == persons_.end() || it->second.verified) return false;

    Person& p = it->second;
    p.verified = true;
    p.activated = true;
    p.trust_score = std::max(p.trust_score, trust_floor);
    for (const auto& [k, v] : profile) {
        p.setAttribute(k, v);
    }
    return true;
}

// ─── Edges ─────────────────────────────────────────────────────

std::vector<Relationship> MemoryStore::loadEdges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_;
}

void MemoryStore::replaceEdges(std::vector<Relationship> edges) {
    std::lock_guard<std::mutex> lock(mutex_);
    edges_.swap(edges);
}

size_t MemoryStore::updateEdgesTouching(const PersonId& id,
                                        const std::function<void(Relationship&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t touched = 0;
    for (auto& e : edges_) {
        if (!e.touches(id)) continue;
        fn(e);
        touched++;
    }
    return touched;
}

// ─── Invitations ───────────────────────────────────────────────

void MemoryStore::insertInvitation(const Invitation& invitation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (invitations_.count(invitation.id)) {
        throw StoreError("Invitation id already exists: " + invitation.id);
    }
    if (token_index_.count(invitation.token)) {
        throw StoreError("Invitation token already exists");
    }
    invitations_.emplace(invitation.id, invitation);
    token_index_.emplace(invitation.token, invitation.id);
}

std::optional<Invitation> MemoryStore::findInvitation(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invitations_.find(id);
    if (it == invitations_.end()) return std::nullopt;
    return it->second;
}

std::optional<Invitation> MemoryStore::findInvitationByToken(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tit = token_index_.find(token);
    if (tit == token_index_.end()) return std::nullopt;
    auto it = invitations_.find(tit->second);
    if (it == invitations_.end()) return std::nullopt;
    return it->second;
}

std::vector<Invitation> MemoryStore::listInvitations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Invitation> result;
    result.reserve(invitations_.size());
    for (const auto& [_, inv] : invitations_) {
        result.push_back(inv);
    }
    return result;
}

bool MemoryStore::transitionInvitation(const std::string& id,
                                       InvitationStatus expected,
                                       InvitationStatus next,
                                       TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invitations_.find(id);
    if (it == invitations_.end() || it->second.status != expected) return false;

    it->second.status = next;
    if (next == InvitationStatus::Accepted) {
        it->second.accepted_at = at;
    } else {
        it->second.accepted_at.reset();
    }
    return true;
}

void MemoryStore::recordNotification(const std::string& id, bool sent,
                                     const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invitations_.find(id);
    if (it == invitations_.end()) return;
    it->second.notification_sent = sent;
    it->second.notification_error = error;
}

size_t MemoryStore::personCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persons_.size();
}

size_t MemoryStore::edgeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_.size();
}

} // namespace warmpath
