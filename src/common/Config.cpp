#include "taglimit/common/Config.h"
#include "taglimit/common/Logger.h"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace taglimit {
namespace common {

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

Config::Settings Config::Parse(std::istream& in) {
    Settings parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) parsed[section][key] = value;
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    Settings parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;

    Settings parsed = Parse(in);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
    }
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::DumpIni() const {
    Settings snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap = settings_;
    }

    std::ostringstream f;
    auto writeSection = [&](const std::string& section, const std::map<std::string, std::string>& kv) {
        f << "[" << section << "]\n";
        for (const auto& it : kv) {
            f << it.first << " = " << it.second << "\n";
        }
        f << "\n";
    };

    // [global] first so re-parsing keeps keys in the same section.
    auto itg = snap.find("global");
    if (itg != snap.end()) {
        writeSection("global", itg->second);
        snap.erase(itg);
    }
    for (const auto& s : snap) {
        writeSection(s.first, s.second);
    }
    return f.str();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != val.size()) {
            LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not an integer, using " << defaultVal;
            return defaultVal;
        }
        return parsed;
    } catch (const std::logic_error&) {
        LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        LOG_WARN << "Config [" << section << "] " << key << " = '" << val << "' is not a number, using " << defaultVal;
        return defaultVal;
    }
}

std::vector<std::string> Config::GetList(const std::string& section, const std::string& key,
                                         const std::vector<std::string>& defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;

    std::vector<std::string> out;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace common
} // namespace taglimit
