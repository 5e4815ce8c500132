#include "integra/config/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <map>
#include <sstream>

namespace Integra {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ConfigLoader::load(const std::string& path) {
    searched_ = { path, "../" + path };

    for (const auto& p : searched_) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            return parse(file);
        }
    }
    return false;
}

bool ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = trim(line.substr(1, closePos - 1));
            }
            continue;
        }

        // Key = Value
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) continue;

        values_[currentSection + "." + key] = value;
    }
    return true;
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) return it->second;
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        return used == val.size() ? v : defaultVal;
    } catch (const std::exception&) {
        return defaultVal;
    }
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "1" || val == "yes" || val == "on")  return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return defaultVal;
}

std::string ConfigLoader::dump() const {
    // Sorted so the output is stable.
    std::map<std::string, std::string> sorted(values_.begin(), values_.end());
    std::ostringstream out;
    for (const auto& kv : sorted) {
        if (kv.first.find("password") != std::string::npos ||
            kv.first.find("secret") != std::string::npos ||
            kv.first.find("token") != std::string::npos) {
            out << kv.first << " = ********\n";
        } else {
            out << kv.first << " = " << kv.second << "\n";
        }
    }
    return out.str();
}

} // namespace Integra
