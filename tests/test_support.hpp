#pragma once

#include "graph/person.hpp"
#include "graph/edge.hpp"
#include "invite/invitation.hpp"
#include "store/memory_store.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace warmpath {
namespace testing_support {

inline Person person(const std::string& id, const std::string& name,
                     const std::string& company = "", const std::string& title = "") {
    Person p(id, name);
    p.company = company;
    p.title = title;
    return p;
}

inline Person withJob(Person p, const std::string& company, int start, int end,
                      const std::string& title = "") {
    p.employment.push_back(Employment{company, title, start, end});
    return p;
}

inline Person withSchool(Person p, const std::string& school,
                         const std::string& degree = "", int year = 0) {
    p.education.push_back(Education{school, degree, year});
    return p;
}

inline Person withHometown(Person p, const std::string& city, const std::string& region) {
    p.hometowns.push_back(Hometown{city, region, "US"});
    return p;
}

/// Alex and Jamie work at Acme; Jamie and Sam went to State University.
inline std::vector<Person> alexJamieSam() {
    return {
        person("alex", "Alex Rivera", "Acme", "Engineer"),
        withSchool(person("jamie", "Jamie Chen", "Acme", "Designer"), "State University"),
        withSchool(person("sam", "Sam Patel", "Globex", "Director"), "State University"),
    };
}

inline void seed(MemoryStore& store, const std::vector<Person>& persons) {
    for (const auto& p : persons) store.upsertPerson(p);
}

/// Store whose reads or writes can be made to fail.
class FlakyStore : public MemoryStore {
public:
    bool fail_reads = false;
    bool fail_writes = false;

    std::vector<Person> loadPersons() const override {
        if (fail_reads) throw StoreError("connection refused");
        return MemoryStore::loadPersons();
    }

    void replaceEdges(std::vector<Relationship> edges) override {
        if (fail_writes) throw StoreError("write timeout");
        MemoryStore::replaceEdges(std::move(edges));
    }
};

/// Manually advanced clock for invitation expiry.
struct FakeClock {
    TimePoint now = std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50));

    void advance(std::chrono::hours h) { now += h; }
};

} // namespace testing_support
} // namespace warmpath
