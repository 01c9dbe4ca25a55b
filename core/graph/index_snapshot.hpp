#pragma once

#include "graph/graph_index.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace warmpath {

/// Holds the current GraphIndex generation.
/// Readers take a shared_ptr and keep using it for the whole request, so a
/// rebuild can publish a new generation while old readers finish on the
/// previous one.
class IndexSnapshot {
public:
    IndexSnapshot();

    /// Current generation. Never null; empty index before the first publish.
    std::shared_ptr<const GraphIndex> current() const;

    /// Replace the current generation. Returns the generation number
    /// assigned to `index`.
    uint64_t publish(std::vector<Person> persons, std::vector<Relationship> edges);

    uint64_t generation() const;

    /// Number of publishes so far.
    size_t publishCount() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const GraphIndex> current_;
    uint64_t next_generation_ = 1;
    size_t publishes_ = 0;
};

} // namespace warmpath
