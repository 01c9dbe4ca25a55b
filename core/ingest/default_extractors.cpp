#include "ingest/default_extractors.hpp"
#include "ingest/extractor_registry.hpp"
#include "ingest/pair_grouper.hpp"
#include "util/text_util.hpp"

#include <map>
#include <memory>
#include <random>
#include <set>
#include <unordered_map>

namespace warmpath {

namespace {

template <typename Record>
using RecordsByKey = std::map<std::string, std::vector<Record>>;

std::string hometownKey(const Hometown& h) {
    std::string city = text::normalize(h.city);
    if (city.empty()) return "";
    return city + "|" + text::normalize(h.region);
}

std::string affiliationKey(const Affiliation& a) {
    std::string org = text::normalize(a.organization);
    if (org.empty()) return "";
    return org + "|" + text::normalize(a.chapter);
}

/// Employment history plus the current company when history omits it.
std::vector<Employment> employmentOf(const Person& p) {
    std::vector<Employment> jobs = p.employment;
    if (!p.company.empty()) {
        std::string current = text::canonicalCompany(p.company);
        bool listed = false;
        for (const auto& j : jobs) {
            if (text::canonicalCompany(j.company) == current) {
                listed = true;
                break;
            }
        }
        if (!listed) jobs.push_back(Employment{p.company, p.title, 0, 0});
    }
    return jobs;
}

} // namespace

// ─── Coworker ──────────────────────────────────────────────────

void CoworkerExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                                const StrengthModel& model, EdgeEmitter& out) const {
    PairGrouper groups(config.max_group_size, config.sampling_seed);
    std::vector<RecordsByKey<Employment>> records(persons.size());

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& job : employmentOf(persons[i])) {
            std::string key = text::canonicalCompany(job.company);
            if (key.empty()) continue;
            records[i][key].push_back(job);
            groups.add(key, i);
        }
    }

    groups.forEachPair([&](const std::string& key, size_t a, size_t b) {
        int best = -1;
        const Employment* ja = nullptr;
        const Employment* jb = nullptr;
        for (const auto& x : records[a][key]) {
            for (const auto& y : records[b][key]) {
                int s = model.coworkerStrength(x, y);
                if (s > best) {
                    best = s;
                    ja = &x;
                    jb = &y;
                }
            }
        }
        if (!ja || !jb) return;

        std::map<std::string, std::string> meta{{"company", ja->company}};
        if (ja->start_year > 0 && jb->start_year > 0) {
            meta["years"] = std::to_string(ja->start_year) + "-" +
                            (ja->end_year > 0 ? std::to_string(ja->end_year) : "present") + "/" +
                            std::to_string(jb->start_year) + "-" +
                            (jb->end_year > 0 ? std::to_string(jb->end_year) : "present");
        }
        out.emit(persons[a].id, persons[b].id, type(), best, meta);
    });
}

// ─── Education ─────────────────────────────────────────────────

void EducationExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                                 const StrengthModel& model, EdgeEmitter& out) const {
    PairGrouper groups(config.max_group_size, config.sampling_seed);
    std::vector<RecordsByKey<Education>> records(persons.size());

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& edu : persons[i].education) {
            std::string key = text::normalize(edu.school);
            if (key.empty()) continue;
            records[i][key].push_back(edu);
            groups.add(key, i);
        }
    }

    groups.forEachPair([&](const std::string& key, size_t a, size_t b) {
        int best = -1;
        const Education* ea = nullptr;
        const Education* eb = nullptr;
        for (const auto& x : records[a][key]) {
            for (const auto& y : records[b][key]) {
                int s = model.educationStrength(x, y);
                if (s > best) {
                    best = s;
                    ea = &x;
                    eb = &y;
                }
            }
        }
        if (!ea || !eb) return;

        std::map<std::string, std::string> meta{{"school", ea->school}};
        if (!ea->degree.empty()) meta["degree1"] = ea->degree;
        if (!eb->degree.empty()) meta["degree2"] = eb->degree;
        if (ea->graduation_year > 0) meta["year1"] = std::to_string(ea->graduation_year);
        if (eb->graduation_year > 0) meta["year2"] = std::to_string(eb->graduation_year);
        out.emit(persons[a].id, persons[b].id, type(), best, meta);
    });
}

// ─── Affiliation ───────────────────────────────────────────────

void AffiliationExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                                   const StrengthModel& model, EdgeEmitter& out) const {
    PairGrouper groups(config.max_group_size, config.sampling_seed);
    std::vector<RecordsByKey<Affiliation>> records(persons.size());

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& aff : persons[i].affiliations) {
            std::string key = affiliationKey(aff);
            if (key.empty()) continue;
            records[i][key].push_back(aff);
            groups.add(key, i);
        }
    }

    groups.forEachPair([&](const std::string& key, size_t a, size_t b) {
        int best = -1;
        const Affiliation* aa = nullptr;
        for (const auto& x : records[a][key]) {
            for (const auto& y : records[b][key]) {
                int s = model.affiliationStrength(x, y);
                if (s > best) {
                    best = s;
                    aa = &x;
                }
            }
        }
        if (!aa) return;

        std::map<std::string, std::string> meta{{"organization", aa->organization}};
        if (!aa->chapter.empty()) meta["chapter"] = aa->chapter;
        out.emit(persons[a].id, persons[b].id, type(), best, meta);
    });
}

// ─── Hometown ──────────────────────────────────────────────────

void HometownExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                                const StrengthModel& model, EdgeEmitter& out) const {
    PairGrouper groups(config.max_group_size, config.sampling_seed);
    std::map<std::string, Hometown> display;

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& h : persons[i].hometowns) {
            std::string key = hometownKey(h);
            if (key.empty()) continue;
            groups.add(key, i);
            display.emplace(key, h);
        }
    }

    groups.forEachPair([&](const std::string& key, size_t a, size_t b) {
        const Hometown& h = display[key];
        std::map<std::string, std::string> meta{{"city", h.city}, {"region", h.region}};
        if (!h.country.empty()) meta["country"] = h.country;
        out.emit(persons[a].id, persons[b].id, type(), model.hometownStrength(), meta);
    });
}

// ─── Family ────────────────────────────────────────────────────

void FamilyExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                              const StrengthModel& model, EdgeEmitter& out) const {
    // Explicit records: a relative listed by full name.
    std::unordered_map<std::string, std::vector<size_t>> by_name;
    for (size_t i = 0; i < persons.size(); i++) {
        std::string n = text::normalize(persons[i].name);
        if (!n.empty()) by_name[n].push_back(i);
    }

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& tie : persons[i].family) {
            auto it = by_name.find(text::normalize(tie.name));
            if (it == by_name.end()) continue;
            for (size_t j : it->second) {
                std::map<std::string, std::string> meta{
                    {"relation", tie.relation.empty() ? "relative" : tie.relation},
                    {"source", "explicit"}};
                out.emit(persons[i].id, persons[j].id, type(), model.familyStrength(true), meta);
            }
        }
    }

    // Heuristic: same surname and a shared hometown.
    PairGrouper groups(config.max_group_size, config.sampling_seed);
    std::vector<std::set<std::string>> towns(persons.size());
    for (size_t i = 0; i < persons.size(); i++) {
        if (text::words(persons[i].name).size() < 2) continue;
        for (const auto& h : persons[i].hometowns) {
            std::string key = hometownKey(h);
            if (!key.empty()) towns[i].insert(key);
        }
        if (!towns[i].empty()) groups.add(text::surname(persons[i].name), i);
    }

    groups.forEachPair([&](const std::string& surname, size_t a, size_t b) {
        for (const auto& town : towns[a]) {
            if (!towns[b].count(town)) continue;
            std::map<std::string, std::string> meta{
                {"relation", "possible_relative"},
                {"source", "surname"},
                {"surname", surname}};
            out.emit(persons[a].id, persons[b].id, type(), model.familyStrength(false), meta);
            return;
        }
    });
}

// ─── Social ────────────────────────────────────────────────────

void SocialTieExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& /*config*/,
                                 const StrengthModel& model, EdgeEmitter& out) const {
    // (platform, handle) → owners
    std::map<std::pair<std::string, std::string>, std::vector<size_t>> owners;
    // (person, platform) → handles it links to
    std::map<std::pair<size_t, std::string>, std::set<std::string>> links;

    for (size_t i = 0; i < persons.size(); i++) {
        for (const auto& profile : persons[i].social_profiles) {
            std::string platform = text::normalize(profile.platform);
            std::string handle = text::normalize(profile.handle);
            if (platform.empty()) continue;
            if (!handle.empty()) owners[{platform, handle}].push_back(i);
            for (const auto& c : profile.connections) {
                std::string h = text::normalize(c);
                if (!h.empty()) links[{i, platform}].insert(h);
            }
        }
    }

    auto linksTo = [&](size_t from, const std::string& platform, size_t to) {
        auto it = links.find({from, platform});
        if (it == links.end()) return false;
        for (const auto& profile : persons[to].social_profiles) {
            if (text::normalize(profile.platform) != platform) continue;
            if (it->second.count(text::normalize(profile.handle))) return true;
        }
        return false;
    };

    for (const auto& [key, handles] : links) {
        size_t i = key.first;
        const std::string& platform = key.second;
        for (const auto& h : handles) {
            auto it = owners.find({platform, h});
            if (it == owners.end()) continue;
            for (size_t j : it->second) {
                if (i == j) continue;
                bool mutual = linksTo(j, platform, i);
                std::map<std::string, std::string> meta{{"platform", platform}};
                if (mutual) meta["mutual"] = "true";
                out.emit(persons[i].id, persons[j].id, type(), model.socialStrength(mutual), meta);
            }
        }
    }
}

// ─── Sampled social (demo data) ────────────────────────────────

void SampledTieExtractor::extract(const std::vector<Person>& persons, const IngestionConfig& config,
                                  const StrengthModel& model, EdgeEmitter& out) const {
    PairGrouper everyone(config.max_group_size, seed_);
    for (size_t i = 0; i < persons.size(); i++) {
        everyone.add("*", i);
    }

    std::mt19937_64 rng(seed_);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    everyone.forEachPair([&](const std::string&, size_t a, size_t b) {
        // Draw for every pair so the sequence does not depend on which
        // pairs are filtered out.
        double draw = coin(rng);
        const Person& pa = persons[a];
        const Person& pb = persons[b];
        if (pa.company.empty() || pb.company.empty()) return;
        if (text::canonicalCompany(pa.company) == text::canonicalCompany(pb.company)) return;
        if (draw >= probability_) return;

        std::map<std::string, std::string> meta{{"platform", "sampled"}};
        out.emit(pa.id, pb.id, type(), model.socialStrength(false), meta);
    });
}

void registerDefaultExtractors(ExtractorRegistry& registry) {
    registry.registerExtractor(std::make_unique<CoworkerExtractor>());
    registry.registerExtractor(std::make_unique<EducationExtractor>());
    registry.registerExtractor(std::make_unique<AffiliationExtractor>());
    registry.registerExtractor(std::make_unique<HometownExtractor>());
    registry.registerExtractor(std::make_unique<FamilyExtractor>());
    registry.registerExtractor(std::make_unique<SocialTieExtractor>());
}

} // namespace warmpath
