#pragma once

#include <string>

namespace utils {

// Joins a base URL and a path with exactly one slash between them
inline std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) {
        return path;
    }
    bool baseSlash = base.back() == '/';
    bool pathSlash = !path.empty() && path.front() == '/';
    if (baseSlash && pathSlash) {
        return base + path.substr(1);
    }
    if (!baseSlash && !pathSlash) {
        return base + "/" + path;
    }
    return base + path;
}

// Replaces every occurrence of placeholder in text
inline std::string replaceAll(std::string text, const std::string& placeholder, const std::string& value) {
    if (placeholder.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
    return text;
}

} // namespace utils
