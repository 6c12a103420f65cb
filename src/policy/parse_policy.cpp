#include "arffkit/parse_policy.hpp"
#include <cctype>
#include <charconv>
#include <cstdio>
#include <string_view>
#include <fast_float/fast_float.h>

namespace ak {

static std::string_view drop_plus(std::string_view s) {
  if (s.size() > 1 && s.front() == '+') s.remove_prefix(1);
  return s;
}

std::optional<std::int64_t> ParsePolicy::parse_integer(std::string_view s) const {
  s = drop_plus(trim(s));
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  s = drop_plus(trim(s));
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::string> ParsePolicy::parse_decimal(std::string_view s) const {
  s = drop_plus(trim(s));
  if (!parse_number(s)) return std::nullopt;
  return std::string(s);
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string_view strip_quotes(std::string_view s) {
  if (s.size() >= 2 && s.front() == s.back() && (s.front() == '"' || s.front() == '\'')) {
    s.remove_prefix(1);
    s.remove_suffix(1);
  }
  return s;
}

std::string format_double(double v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc()) {
    int n = std::snprintf(buf, sizeof(buf), "%.17g", v);
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
  }
  return std::string(buf, ptr);
}

bool iequals_prefix(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size()) return false;
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
      return false;
  }
  return true;
}

}
