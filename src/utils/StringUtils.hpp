#pragma once

#include <string>
#include <vector>

namespace string_utils
{

// Trims trailing whitespace from a string.
std::string Rtrim(std::string str);

// Trims leading whitespace from a string.
std::string Ltrim(std::string str);

// Trims leading and trailing whitespace from a string.
std::string Trim(std::string str);

// ASCII lower-casing.
std::string ToLower(std::string str);

// Splits on every occurrence of 'delimiter'. Empty fields are kept.
std::vector<std::string> Split(const std::string& str, char delimiter);

bool StartsWith(const std::string& str, const std::string& prefix);
bool EndsWith(const std::string& str, const std::string& suffix);

}  // namespace string_utils
