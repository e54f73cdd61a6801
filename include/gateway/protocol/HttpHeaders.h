#pragma once

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace protocol {

// Header fields in wire order; names keep their original case and may repeat.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

inline bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// True when the comma separated header value lists `token` (case-insensitive).
inline bool HeaderHasToken(const std::string& value, const std::string& token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        size_t b = pos;
        size_t e = comma;
        while (b < e && std::isspace(static_cast<unsigned char>(value[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
        if (IEquals(value.substr(b, e - b), token)) return true;
        pos = comma + 1;
    }
    return false;
}

inline const std::string* FindHeader(const HeaderList& headers, const std::string& field) {
    for (const auto& h : headers) {
        if (IEquals(h.first, field)) return &h.second;
    }
    return nullptr;
}

inline void RemoveHeader(HeaderList* headers, const std::string& field) {
    for (auto it = headers->begin(); it != headers->end();) {
        if (IEquals(it->first, field)) {
            it = headers->erase(it);
        } else {
            ++it;
        }
    }
}

const char* ReasonPhrase(int statusCode);

} // namespace protocol
} // namespace gateway
