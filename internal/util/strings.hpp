#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeline::util {

/*
  ASCII string helpers. Identifiers, headers and field names are
  compared case-insensitively throughout the store.
*/

std::string ToLower(std::string_view text);
std::string ToUpper(std::string_view text);
std::string Trim(std::string_view text);

bool IsBlank(std::string_view text);
bool EqualsIgnoreCase(std::string_view a, std::string_view b);
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// Removes every occurrence of each token.
std::string RemoveAll(std::string_view text, std::initializer_list<std::string_view> tokens);

// Splits on any of `delimiters`, trims each piece, drops empty pieces.
std::vector<std::string> Split(std::string_view text, std::string_view delimiters);
std::string              Join(const std::vector<std::string>& parts, std::string_view separator);

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string EscapeUriComponent(std::string_view text);

// Shortest representation that parses back to the same value.
std::string           FormatDecimal(double value);
std::optional<double> ParseDecimal(std::string_view text);
std::optional<int>    ParseInt(std::string_view text);

} // namespace pipeline::util
