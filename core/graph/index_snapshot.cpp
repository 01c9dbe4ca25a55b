#include "graph/index_snapshot.hpp"

namespace warmpath {

IndexSnapshot::IndexSnapshot()
    : current_(std::make_shared<const GraphIndex>()) {}

std::shared_ptr<const GraphIndex> IndexSnapshot::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t IndexSnapshot::publish(std::vector<Person> persons, std::vector<Relationship> edges) {
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gen = next_generation_++;
    }

    // Build outside the lock; readers keep the old generation meanwhile.
    auto index = std::make_shared<const GraphIndex>(
        GraphIndex::build(std::move(persons), std::move(edges), gen));

    std::lock_guard<std::mutex> lock(mutex_);
    // A slower, older build must not replace a newer one.
    if (gen > current_->generation()) {
        current_ = std::move(index);
    }
    publishes_++;
    return gen;
}

uint64_t IndexSnapshot::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->generation();
}

size_t IndexSnapshot::publishCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishes_;
}

} // namespace warmpath
