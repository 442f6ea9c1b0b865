#include "StringUtils.hpp"

#include <algorithm>  // For std::find_if, std::transform
#include <cctype>     // For std::isspace, std::tolower
#include <cstddef>
#include <string>
#include <utility>

namespace string_utils
{
// Function to trim leading whitespace
std::string Ltrim(std::string str)
{
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char chr) { return !std::isspace(chr); }));
    return str;
}

// Function to trim trailing whitespace
std::string Rtrim(std::string str)
{
    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char chr) { return !std::isspace(chr); }).base(), str.end());
    return str;
}

// Function to trim both leading and trailing whitespace
std::string Trim(std::string str)
{
    return Ltrim(Rtrim(std::move(str)));
}

std::string ToLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
    return str;
}

std::vector<std::string> Split(const std::string& str, char delimiter)
{
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos = 0;
    while ((pos = str.find(delimiter, start)) != std::string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(str.substr(start));
    return parts;
}

bool StartsWith(const std::string& str, const std::string& prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace string_utils
