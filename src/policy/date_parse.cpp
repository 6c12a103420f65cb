#include "arffkit/date_parse.hpp"
#include "arffkit/parse_policy.hpp"
#include <cstdio>
#include <string_view>

namespace ak {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static int days_in_month(int y, int m) {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
  return days[m - 1];
}

std::tm DateTime::to_tm() const {
  std::tm tm{};
  tm.tm_year = year - 1900; tm.tm_mon = month - 1; tm.tm_mday = day;
  tm.tm_hour = hour; tm.tm_min = minute; tm.tm_sec = second;
  tm.tm_isdst = -1;
  return tm;
}

std::optional<DateTime> parse_date_text(std::string_view s) {
  s = trim(s);
  if (s.size() < 10) return std::nullopt;
  DateTime dt;

  const char sep = s[4];
  if (sep != '-' && sep != '/' && sep != '.') return std::nullopt;
  if (!(parse_int(s.substr(0,4), dt.year) && parse_int(s.substr(5,2), dt.month) &&
        s[7]==sep && parse_int(s.substr(8,2), dt.day)))
    return std::nullopt;
  if (dt.month < 1 || dt.month > 12) return std::nullopt;
  if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    // HH:MM is the minimum accepted time part
    if (i+5 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), dt.hour) && s[i+2]==':' && parse_int(s.substr(i+3,2), dt.minute)))
      return std::nullopt;
    i += 5;
    if (i < s.size() && s[i]==':') {
      if (i+3 > s.size() || !parse_int(s.substr(i+1,2), dt.second)) return std::nullopt;
      i += 3;
      if (i < s.size() && s[i]=='.') {
        ++i;
        size_t j = i;
        while (j < s.size() && is_digit(s[j])) ++j;
        if (j == i) return std::nullopt;
        i = j;
      }
    }
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 60) return std::nullopt;
  }

  // Zone suffix: Z, +HH, +HHMM, +HH:MM (ignored)
  if (i < s.size()) {
    std::string_view zone = s.substr(i);
    if (zone == "Z" || zone == "z") return dt;
    if (zone[0] != '+' && zone[0] != '-') return std::nullopt;
    zone.remove_prefix(1);
    int tmp = 0;
    if (zone.size() == 2 || zone.size() == 4) {
      if (!parse_int(zone, tmp)) return std::nullopt;
    } else if (zone.size() == 5 && zone[2] == ':') {
      if (!(parse_int(zone.substr(0,2), tmp) && parse_int(zone.substr(3,2), tmp))) return std::nullopt;
    } else {
      return std::nullopt;
    }
  }
  return dt;
}

static void replace_all(std::string& s, std::string_view from, std::string_view to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string weka_to_strftime(std::string_view pattern) {
  std::string p(pattern);
  replace_all(p, "yyyy", "%Y");
  replace_all(p, "MM", "%m");
  replace_all(p, "dd", "%d");
  replace_all(p, "HH", "%H");
  replace_all(p, "mm", "%M");
  replace_all(p, "ss", "%S");
  return p;
}

std::optional<std::string> format_date(const DateTime& dt, std::string_view weka_pattern) {
  if (weka_pattern.empty()) return std::string();
  const std::string fmt = weka_to_strftime(weka_pattern);
  const std::tm tm = dt.to_tm();
  char buf[256];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
  if (n == 0) return std::nullopt;
  return std::string(buf, n);
}

std::string iso_text(const DateTime& dt) {
  char buf[32];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                        dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
  return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
}

}
