#pragma once

#include <map>
#include <mutex>
#include <string>

#include "gateway/common/noncopyable.h"

namespace gateway {
namespace common {

// INI-style key/value store: "[section]" headers, "key = value" lines,
// '#' or ';' comments. Keys before the first header belong to "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Same as Load, from a string.
    bool LoadFromString(const std::string& iniText);

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Snapshot of one section; empty when the section is absent.
    std::map<std::string, std::string> GetSection(const std::string& section) const;

    static bool ParseBool(const std::string& value, bool defaultVal);

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static std::map<std::string, std::map<std::string, std::string>> Parse(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, std::map<std::string, std::string>> settings_;
};

} // namespace common
} // namespace gateway
