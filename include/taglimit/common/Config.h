#pragma once

#include <string>
#include <istream>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include "taglimit/common/noncopyable.h"

namespace taglimit {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys before the first header land in the "global" section.
class Config : noncopyable {
public:
    Config() = default;

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    // Update config in-memory (does not auto-save).
    void SetString(const std::string& section, const std::string& key, const std::string& value);

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    // Dump current settings to INI text.
    std::string DumpIni() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    // Get value as double
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;

    // Comma separated list, items trimmed, empty items skipped.
    std::vector<std::string> GetList(const std::string& section, const std::string& key,
                                     const std::vector<std::string>& defaultVal = {}) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    static std::string Trim(const std::string& s);
    static Settings Parse(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace taglimit
