#include "ingest/pair_grouper.hpp"
#include "util/text_util.hpp"

#include <algorithm>
#include <random>

namespace warmpath {

void PairGrouper::add(const std::string& key, size_t member) {
    if (key.empty()) return;
    auto& members = groups_[key];
    if (std::find(members.begin(), members.end(), member) == members.end()) {
        members.push_back(member);
    }
}

std::vector<size_t> PairGrouper::membersOf(const std::string& key,
                                           const std::vector<size_t>& all) const {
    std::vector<size_t> members = all;
    std::sort(members.begin(), members.end());
    if (max_group_size_ == 0 || members.size() <= max_group_size_) {
        return members;
    }

    // Seed depends only on the key, so the same evidence samples the same
    // members on every rebuild.
    std::mt19937_64 rng(seed_ ^ text::fnv1a(key));
    std::shuffle(members.begin(), members.end(), rng);
    members.resize(max_group_size_);
    std::sort(members.begin(), members.end());
    return members;
}

void PairGrouper::forEachPair(
    const std::function<void(const std::string&, size_t, size_t)>& fn) const {
    for (const auto& [key, all] : groups_) {
        if (all.size() < 2) continue;
        auto members = membersOf(key, all);
        for (size_t i = 0; i < members.size(); i++) {
            for (size_t j = i + 1; j < members.size(); j++) {
                fn(key, members[i], members[j]);
            }
        }
    }
}

size_t PairGrouper::sampledGroups() const {
    if (max_group_size_ == 0) return 0;
    size_t n = 0;
    for (const auto& [_, members] : groups_) {
        if (members.size() > max_group_size_) n++;
    }
    return n;
}

size_t PairGrouper::pairBudget() const {
    size_t total = 0;
    for (const auto& [_, members] : groups_) {
        size_t g = members.size();
        if (max_group_size_ > 0) g = std::min(g, max_group_size_);
        total += g * (g > 0 ? g - 1 : 0) / 2;
    }
    return total;
}

} // namespace warmpath
