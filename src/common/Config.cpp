#include "streamgate/common/Config.h"
#include "streamgate/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace streamgate {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::map<std::string, Config::Section> Config::Parse(std::istream& in) {
    std::map<std::string, Section> parsed;
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

    auto parsed = Parse(file);
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
    auto parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? defaultVal : kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

int64_t Config::GetInt64(const std::string& section, const std::string& key, int64_t defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return static_cast<int64_t>(std::stoll(val));
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

uint64_t Config::GetSize(const std::string& section, const std::string& key, uint64_t defaultVal) {
    const int64_t val = GetInt64(section, key, static_cast<int64_t>(defaultVal));
    if (val < 0) {
        throw std::invalid_argument("[" + section + "] " + key + " must not be negative");
    }
    return static_cast<uint64_t>(val);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not a number, using " << defaultVal;
        return defaultVal;
    }
}

std::vector<std::string> Config::SplitCsv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            cur = Trim(cur);
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cur = Trim(cur);
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> Config::GetList(const std::string& section, const std::string& key) {
    return SplitCsv(GetString(section, key, ""));
}

Config::Section Config::GetSection(const std::string& section) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(section);
    return it == settings_.end() ? Section{} : it->second;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) {
    std::vector<std::pair<std::string, Section>> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : settings_) {
        if (kv.first.rfind(prefix, 0) != 0) continue;
        out.push_back({kv.first, kv.second});
    }
    return out;
}

} // namespace common
} // namespace streamgate
