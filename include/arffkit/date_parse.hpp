#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace ak {

// Weka's documented default is "yyyy-MM-dd'T'HH:mm:ss", but Weka itself
// rejects that when reading, so the space-separated form is used.
inline constexpr std::string_view kDefaultDatePattern = "yyyy-MM-dd HH:mm:ss";

struct DateTime {
  int year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;

  std::tm to_tm() const;
  bool operator==(const DateTime& o) const {
    return year == o.year && month == o.month && day == o.day &&
           hour == o.hour && minute == o.minute && second == o.second;
  }
  bool operator!=(const DateTime& o) const { return !(*this == o); }
};

// Lenient parse of free-text dates:
//   YYYY-MM-DD | YYYY/MM/DD | YYYY.MM.DD
//   optionally followed by [T| ]HH:MM[:SS[.fff]] and a Z or +HH[:MM] suffix.
// Fractional seconds and offsets are dropped.
std::optional<DateTime> parse_date_text(std::string_view s);

// yyyy,MM,dd,HH,mm,ss -> %Y,%m,%d,%H,%M,%S
std::string weka_to_strftime(std::string_view pattern);

// Format with a Weka pattern; nullopt if strftime produced nothing.
std::optional<std::string> format_date(const DateTime& dt, std::string_view weka_pattern);

// "YYYY-MM-DD HH:MM:SS"
std::string iso_text(const DateTime& dt);

}
