#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Spoor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        icontains(std::string_view haystack, std::string_view needle);

// Splits on any character of `delimiters`, dropping empty pieces.
std::vector<std::string> split_any(const std::string& str, const std::string& delimiters);

// Replaces every occurrence of `token` in `str`.
std::string replace_all(std::string str, const std::string& token, const std::string& value);

}  // namespace Text
}  // namespace Utils
}  // namespace Spoor
