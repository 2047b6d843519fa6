#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Spoor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char c1, char c2) {
            return std::tolower(static_cast<unsigned char>(c1))
                   == std::tolower(static_cast<unsigned char>(c2));
        });
    return it != haystack.end();
}

std::vector<std::string> split_any(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> parts;
    size_t                   start = 0;
    while (start < str.size()) {
        size_t end = str.find_first_of(delimiters, start);
        if (end == std::string::npos)
            end = str.size();
        if (end > start)
            parts.push_back(str.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::string replace_all(std::string str, const std::string& token, const std::string& value) {
    if (token.empty())
        return str;
    size_t pos = 0;
    while ((pos = str.find(token, pos)) != std::string::npos) {
        str.replace(pos, token.size(), value);
        pos += value.size();
    }
    return str;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Spoor
