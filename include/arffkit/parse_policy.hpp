#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ak {

// The ARFF missing-value token. Valid for every attribute kind.
inline constexpr std::string_view kMissing = "?";

struct ParsePolicy {
  // Exact integer parse (std::from_chars). The whole field must be consumed;
  // a leading '+' is accepted.
  std::optional<std::int64_t> parse_integer(std::string_view s) const;

  // Float parse (fast_float in .cpp). Whole field must be consumed.
  std::optional<double> parse_number(std::string_view s) const;

  // Validate `s` as a decimal literal and return the digits to keep. Numeric
  // columns keep this text so a write after parse reproduces the input.
  std::optional<std::string> parse_decimal(std::string_view s) const;

  bool is_missing_token(std::string_view s) const { return s == kMissing; }
};

// Strip ASCII whitespace on both ends.
std::string_view trim(std::string_view s);

// Strip one pair of matching surrounding quotes (' or ").
std::string_view strip_quotes(std::string_view s);

// Shortest round-trip text for a double.
std::string format_double(double v);

bool iequals_prefix(std::string_view s, std::string_view prefix);

}
