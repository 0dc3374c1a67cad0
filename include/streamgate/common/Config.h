#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <utility>
#include <optional>
#include "streamgate/common/noncopyable.h"

namespace streamgate {
namespace common {

// INI settings: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys before the first header belong to "global".
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text, replacing the current settings.
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);
    int64_t GetInt64(const std::string& section, const std::string& key, int64_t defaultVal = 0);
    // Sizes and counts. Throws std::invalid_argument on a negative value.
    uint64_t GetSize(const std::string& section, const std::string& key, uint64_t defaultVal = 0);
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0);

    // Comma separated value split into trimmed, non-empty items.
    std::vector<std::string> GetList(const std::string& section, const std::string& key);

    // Whole section (empty if missing).
    Section GetSection(const std::string& section);

    // Get sections whose name starts with prefix, returning (section_name, key->value) pairs.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix);

    static std::vector<std::string> SplitCsv(const std::string& s);

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static std::map<std::string, Section> Parse(std::istream& in);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace streamgate
