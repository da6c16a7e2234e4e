#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <iterator>
#include <ranges>

namespace hogpen::util {
namespace {

void append_escaped(std::string& payload, std::string_view value) {
  for (char c : value) {
    if (c == '\n') {
      payload.append("\\n");
    } else if (c == '\\') {
      payload.append("\\\\");
    } else {
      payload.push_back(c);
    }
  }
}

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

template <typename Sink>
void scan_canonical(std::string_view payload, Sink&& sink) {
  std::string key;
  std::string value;
  key.reserve(64);
  value.reserve(payload.size());

  bool reading_key = true;
  bool escaping = false;
  for (char c : payload) {
    if (reading_key) {
      if (c == '=') {
        reading_key = false;
        continue;
      }
      if (c == '\n') {
        key.clear();
        continue;
      }
      key.push_back(c);
      continue;
    }

    if (escaping) {
      value.push_back(c == 'n' ? '\n' : c);
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (c == '\n') {
      if (!key.empty()) {
        sink(key, value);
      }
      key.clear();
      value.clear();
      reading_key = true;
      continue;
    }

    value.push_back(c);
  }

  if (!reading_key && !key.empty()) {
    sink(key, value);
  }
}

}  // namespace

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    append_escaped(payload, value);
    payload.push_back('\n');
  }

  return payload;
}

std::string canonical_join(const std::map<std::string, std::string>& fields) {
  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    append_escaped(payload, value);
    payload.push_back('\n');
  }
  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;
  scan_canonical(payload, [&parsed](const std::string& key, const std::string& value) {
    parsed.emplace(key, value);
  });
  return parsed;
}

std::map<std::string, std::string> parse_canonical_ordered(std::string_view payload) {
  std::map<std::string, std::string> parsed;
  scan_canonical(payload, [&parsed](const std::string& key, const std::string& value) {
    parsed.emplace(key, value);
  });
  return parsed;
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::string from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return {};
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

std::vector<std::string_view> split_fields(std::string_view line, char separator) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == separator) {
      fields.push_back(line.substr(start, i - start));
      start = i + 1U;
    }
  }
  return fields;
}

bool parse_int64(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

bool parse_uint64(std::string_view text, std::uint64_t& out) {
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

std::string field_or(const std::unordered_map<std::string, std::string>& fields, const std::string& key,
                     std::string fallback) {
  const auto it = fields.find(key);
  return it == fields.end() ? std::move(fallback) : it->second;
}

std::int64_t int_field_or(const std::unordered_map<std::string, std::string>& fields, const std::string& key,
                          std::int64_t fallback) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return fallback;
  }
  std::int64_t parsed = 0;
  return parse_int64(it->second, parsed) ? parsed : fallback;
}

}  // namespace hogpen::util
