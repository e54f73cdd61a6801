#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace gateway {
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

std::map<std::string, std::map<std::string, std::string>> Config::Parse(std::istream& in) {
    std::map<std::string, std::map<std::string, std::string>> parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) continue;
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) parsed[section][key] = value;
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
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not a number, using " << defaultVal;
        return defaultVal;
    }
}

bool Config::ParseBool(const std::string& value, bool defaultVal) {
    std::string v;
    v.reserve(value.size());
    for (unsigned char c : value) v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defaultVal;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    return ParseBool(GetString(section, key, ""), defaultVal);
}

std::map<std::string, std::string> Config::GetSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(section);
    if (it == settings_.end()) return {};
    return it->second;
}

} // namespace common
} // namespace gateway
