// =============================================================================
// ConfigLoader.hpp - INI file parser
// =============================================================================
// Sections map to key prefixes: "[fetch] retries = 3" is stored as
// "fetch.retries". Lines starting with '#' or ';' are comments.
//
// USAGE:
//   ConfigLoader loader;
//   loader.load("integra.ini");
//   AppConfig cfg = loadAppConfig(loader);
// =============================================================================
#pragma once

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Integra {

class ConfigLoader {
public:
    ConfigLoader() = default;

    // Tries `path`, then "../<path>". Returns false when none can be opened;
    // the loader is then empty and every getter returns its default.
    bool load(const std::string& path);

    // Parse an already-open stream (used by tests and by load()).
    bool parse(std::istream& in);

    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    int    getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    bool   getBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    const std::string& configPath() const { return configPath_; }
    const std::vector<std::string>& searchedPaths() const { return searched_; }

    // One "section.key = value" line per entry, secrets masked.
    std::string dump() const;

private:
    std::string configPath_;
    std::vector<std::string> searched_;
    std::unordered_map<std::string, std::string> values_;
};

} // namespace Integra
