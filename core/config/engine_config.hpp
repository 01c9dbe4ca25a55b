#pragma once

#include "ingest/strength_model.hpp"
#include "invite/invitation_service.hpp"
#include "match/identity_matcher.hpp"
#include "path/path_state.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace warmpath {

/// A configuration value could not be parsed.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Everything needed to stand up a WarmPathService.
struct EngineConfig {
    IngestionConfig ingestion;
    PathConfig path;
    MatchConfig match;
    InviteConfig invite;
    std::chrono::minutes rebuild_interval{60};
    std::string log_level = "info";
};

// ─── ConfigParser ──────────────────────────────────────────────
// key=value settings. '#' or ';' starts a comment at the beginning of
// a line or after whitespace; inside a value (`pa#ss`, `a;b`) it is
// kept. [section] headers and blank lines are ignored. Keys are
// case-insensitive and values may be double-quoted. Lookups prefer the environment: key "max_hops" is
// overridden by WARMPATH_MAX_HOPS ('.' becomes '_').

class ConfigParser {
public:
    /// Read a file. A missing file is not an error and leaves the parser
    /// empty, so defaults apply. Returns whether the file existed.
    bool loadFile(const std::string& path);

    /// Read settings from a stream, replacing any loaded before.
    void load(std::istream& in);

    std::optional<std::string> get(const std::string& key) const;
    std::string getString(const std::string& key, const std::string& fallback) const;

    /// Throw ConfigError if the value is present but malformed.
    int64_t getInt(const std::string& key, int64_t fallback) const;
    double getDouble(const std::string& key, double fallback) const;
    bool getBool(const std::string& key, bool fallback) const;

    /// Settings whose key starts with `prefix`, with the prefix removed.
    std::map<std::string, std::string> withPrefix(const std::string& prefix) const;

    size_t size() const { return settings_.size(); }

    static std::string envName(const std::string& key);

private:
    std::map<std::string, std::string> settings_;
};

/// Build an EngineConfig from parsed settings on top of the defaults.
EngineConfig configFromParser(const ConfigParser& parser);

/// Load `path` (if it exists) plus environment overrides.
EngineConfig loadConfig(const std::string& path);

} // namespace warmpath
