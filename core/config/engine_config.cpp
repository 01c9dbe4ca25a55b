#include "config/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace warmpath {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isCommentStart(char c) { return c == '#' || c == ';'; }

/// `#` or `;` starts a comment at the beginning of a line or after
/// whitespace, so secrets and URLs may contain either character.
std::string stripInlineComment(const std::string& value) {
    for (size_t i = 1; i < value.size(); i++) {
        if (isCommentStart(value[i]) && std::isspace(static_cast<unsigned char>(value[i - 1]))) {
            return value.substr(0, i);
        }
    }
    return value;
}

bool parseLine(const std::string& line, std::string& key, std::string& value) {
    std::string clean = trim(line);
    if (clean.empty() || isCommentStart(clean.front())) return false;
    if (clean.front() == '[' && clean.back() == ']') return false;

    size_t eq = clean.find('=');
    if (eq == std::string::npos) return false;

    key = lower(trim(clean.substr(0, eq)));
    std::string raw = trim(clean.substr(eq + 1));

    if (!raw.empty() && raw.front() == '"') {
        // Quoted values are taken verbatim up to the closing quote.
        size_t close = raw.find('"', 1);
        value = close == std::string::npos ? trim(stripInlineComment(raw))
                                           : raw.substr(1, close - 1);
    } else {
        value = trim(stripInlineComment(raw));
    }
    return !key.empty();
}

/// Reads a count that must be at least `min` before it is narrowed, so
/// negative input cannot wrap around to a huge size_t.
size_t getCount(const ConfigParser& parser, const std::string& key, size_t fallback, int64_t min) {
    int64_t v = parser.getInt(key, static_cast<int64_t>(fallback));
    if (v < min) {
        throw ConfigError(key + " must be at least " + std::to_string(min));
    }
    return static_cast<size_t>(v);
}

} // namespace

// ─── ConfigParser ──────────────────────────────────────────────

std::string ConfigParser::envName(const std::string& key) {
    std::string name = "WARMPATH_" + key;
    for (char& c : name) {
        c = c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

bool ConfigParser::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        settings_.clear();
        spdlog::debug("[Config] {} not found, using defaults", path);
        return false;
    }
    load(file);
    spdlog::info("[Config] Loaded {} settings from {}", settings_.size(), path);
    return true;
}

void ConfigParser::load(std::istream& in) {
    settings_.clear();
    std::string line;
    while (std::getline(in, line)) {
        std::string key, value;
        if (parseLine(line, key, value)) {
            settings_[key] = value;
        }
    }
}

std::optional<std::string> ConfigParser::get(const std::string& key) const {
    std::string k = lower(key);
    if (const char* env = std::getenv(envName(k).c_str())) {
        return std::string(env);
    }
    auto it = settings_.find(k);
    if (it == settings_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigParser::getString(const std::string& key, const std::string& fallback) const {
    return get(key).value_or(fallback);
}

int64_t ConfigParser::getInt(const std::string& key, int64_t fallback) const {
    auto v = get(key);
    if (!v || v->empty()) return fallback;
    try {
        size_t used = 0;
        int64_t n = std::stoll(*v, &used);
        if (used != v->size()) throw std::invalid_argument(*v);
        return n;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": " + *v);
    }
}

double ConfigParser::getDouble(const std::string& key, double fallback) const {
    auto v = get(key);
    if (!v || v->empty()) return fallback;
    try {
        size_t used = 0;
        double d = std::stod(*v, &used);
        if (used != v->size()) throw std::invalid_argument(*v);
        return d;
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": " + *v);
    }
}

bool ConfigParser::getBool(const std::string& key, bool fallback) const {
    auto v = get(key);
    if (!v || v->empty()) return fallback;
    std::string s = lower(*v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw ConfigError("Invalid boolean for " + key + ": " + *v);
}

std::map<std::string, std::string> ConfigParser::withPrefix(const std::string& prefix) const {
    std::map<std::string, std::string> out;
    std::string p = lower(prefix);
    for (const auto& [key, _] : settings_) {
        if (key.size() > p.size() && key.compare(0, p.size(), p) == 0) {
            out[key.substr(p.size())] = getString(key, "");
        }
    }
    return out;
}

// ─── EngineConfig ──────────────────────────────────────────────

EngineConfig configFromParser(const ConfigParser& parser) {
    EngineConfig c;

    c.ingestion.max_group_size = getCount(parser, "max_group_size", c.ingestion.max_group_size, 2);
    c.ingestion.sampling_seed = static_cast<uint64_t>(
        parser.getInt("sampling_seed", static_cast<int64_t>(c.ingestion.sampling_seed)));
    c.ingestion.ghost_confidence_penalty = static_cast<int>(
        parser.getInt("ghost_confidence_penalty", c.ingestion.ghost_confidence_penalty));
    c.ingestion.activation_confidence_bonus = static_cast<int>(
        parser.getInt("activation_confidence_bonus", c.ingestion.activation_confidence_bonus));
    c.ingestion.current_year = static_cast<int>(
        parser.getInt("current_year", c.ingestion.current_year));
    c.ingestion.credentials = parser.withPrefix("credential.");

    c.path.default_max_hops = static_cast<int>(parser.getInt("max_hops", c.path.default_max_hops));
    c.path.hop_limit = static_cast<int>(parser.getInt("hop_limit", c.path.hop_limit));
    c.path.top_n = getCount(parser, "top_paths", c.path.top_n, 1);
    c.path.max_expansions = static_cast<int>(
        parser.getInt("max_expansions", c.path.max_expansions));

    c.match.max_results = getCount(parser, "max_matches", c.match.max_results, 1);
    c.match.min_fuzzy_score = parser.getDouble("min_fuzzy_score", c.match.min_fuzzy_score);

    c.invite.ttl_hours = static_cast<int>(parser.getInt("invite_ttl_hours", c.invite.ttl_hours));
    c.invite.trust_floor = static_cast<int>(parser.getInt("trust_floor", c.invite.trust_floor));
    c.invite.activation_base_url =
        parser.getString("activation_base_url", c.invite.activation_base_url);

    c.rebuild_interval = std::chrono::minutes(
        parser.getInt("rebuild_interval_minutes", c.rebuild_interval.count()));
    c.log_level = parser.getString("log_level", c.log_level);

    if (c.path.default_max_hops < 1 || c.path.hop_limit < 1) {
        throw ConfigError("max_hops and hop_limit must be at least 1");
    }
    if (c.path.max_expansions < 1) {
        throw ConfigError("max_expansions must be at least 1");
    }
    if (c.rebuild_interval.count() < 1) {
        throw ConfigError("rebuild_interval_minutes must be at least 1");
    }
    return c;
}

EngineConfig loadConfig(const std::string& path) {
    ConfigParser parser;
    if (!parser.loadFile(path)) {
        spdlog::info("[Config] No config file at {}; defaults and environment only", path);
    }
    return configFromParser(parser);
}

} // namespace warmpath
