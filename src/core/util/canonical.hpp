#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hogpen::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::string canonical_join(const std::map<std::string, std::string>& fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);
std::map<std::string, std::string> parse_canonical_ordered(std::string_view payload);

std::string to_hex(std::string_view bytes);
// Empty on odd length or a non-hex digit.
std::string from_hex(std::string_view hex);

std::vector<std::string_view> split_fields(std::string_view line, char separator);
bool parse_int64(std::string_view text, std::int64_t& out);
bool parse_uint64(std::string_view text, std::uint64_t& out);

// Field lookup helpers for decoded canonical payloads.
std::string field_or(const std::unordered_map<std::string, std::string>& fields, const std::string& key,
                     std::string fallback = {});
std::int64_t int_field_or(const std::unordered_map<std::string, std::string>& fields, const std::string& key,
                          std::int64_t fallback = 0);

}  // namespace hogpen::util
