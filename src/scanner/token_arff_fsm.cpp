#include "arffkit/token_arff_fsm.hpp"
#include "arffkit/dataset.hpp"
#include "arffkit/parse_policy.hpp"

#include <cctype>
#include <iostream>
#include <limits>
#include <string_view>
#include <vector>

namespace ak {

static bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
         c == '[' || c == ']';
}

std::vector<std::string> tokenize_attribute(std::string_view line) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < line.size()) {
    const char c = line[i];
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
      std::size_t j = i + 1;
      while (j < line.size() && is_ident_char(line[j])) ++j;
      out.emplace_back(line.substr(i, j - i));
      i = j;
    } else if (c == '{') {
      std::size_t j = line.find('}', i + 1);
      if (j == std::string_view::npos) { ++i; continue; }
      out.emplace_back(line.substr(i, j - i + 1));
      i = j + 1;
    } else if (c == '\'' || c == '"') {
      std::size_t j = line.find(c, i + 1);
      // quoted tokens need at least one character
      if (j == std::string_view::npos || j == i + 1) { ++i; continue; }
      out.emplace_back(line.substr(i, j - i + 1));
      i = j + 1;
    } else {
      ++i;
    }
  }
  return out;
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::vector<std::string_view> split_fields(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find(',', start);
    if (pos == std::string_view::npos) { out.push_back(trim(s.substr(start))); break; }
    out.push_back(trim(s.substr(start, pos - start)));
    start = pos + 1;
  }
  return out;
}

// Split on commas not preceded by a backslash.
static std::vector<std::string_view> split_unescaped(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == ',' && (i == 0 || s[i-1] != '\\')) {
      out.push_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(s.substr(start));
  return out;
}

struct ArffFsm::Impl {
  Dataset& ds;
  ParserConfig cfg;
  State state{State::Comment};
  std::vector<std::string> comment;
  std::uint64_t line_no{0};
  std::uint64_t warnings{0};
  bool stopped{false};

  void warn(const std::string& msg) {
    ++warnings;
    if (cfg.on_warning) cfg.on_warning(msg);
    else std::cerr << "[arffkit] warning: " << msg << "\n";
  }

  bool dispatch(std::string_view line, std::string& err) {
    switch (state) {
      case State::Comment:
        if (!line.empty() && line[0] == cfg.comment) {
          std::string_view body = line.substr(1);
          if (!body.empty() && body[0] == ' ') body.remove_prefix(1);
          comment.emplace_back(body);
          return true;
        }
        close_comment();
        return dispatch(line, err);

      case State::Header: {
        const std::string_view l = trim(line);
        if (iequals_prefix(l, "@relation ") || iequals_prefix(l, "@relation\t")) {
          if (!ds.streaming()) parse_relation(l);
        } else if (iequals_prefix(l, "@attribute ") || iequals_prefix(l, "@attribute\t")) {
          return parse_attribute(l, err);
        } else if (iequals_prefix(l, "@data")) {
          state = State::Data;
          if (cfg.schema_only) stopped = true;
        }
        return true;
      }

      case State::Data: {
        const std::string_view l = trim(line);
        if (l.empty() || l[0] == cfg.comment) return true;
        if (l[0] == '{') return parse_sparse(l, err);
        return parse_dense(l, err);
      }
    }
    return true;
  }

  // An existing comment survives a text with none; a streamed header is never touched.
  void close_comment() {
    if (!comment.empty() && !ds.streaming()) ds.schema_.set_comment(std::move(comment));
    comment.clear();
    state = State::Header;
  }

  void parse_relation(std::string_view l) {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < l.size() && parts.size() < 2) {
      while (i < l.size() && std::isspace(static_cast<unsigned char>(l[i]))) ++i;
      std::size_t j = i;
      while (j < l.size() && !std::isspace(static_cast<unsigned char>(l[j]))) ++j;
      if (j > i) parts.push_back(l.substr(i, j - i));
      i = j;
    }
    ds.schema_.set_relation(parts.size() > 1 ? std::string(parts[1]) : std::string());
  }

  bool parse_attribute(std::string_view l, std::string& err) {
    if (ds.streaming()) {
      err = "Attempting to add data that doesn't match the schema while streaming.";
      return false;
    }
    const auto tok = tokenize_attribute(l);
    if (tok.size() < 3) { err = "Malformed attribute declaration: " + std::string(l); return false; }

    const std::string name(strip_quotes(tok[1]));
    const std::string& atype = tok[2];
    const std::string kind = lower(atype);

    AttributeSpec spec;
    spec.name = name;
    if (kind == "integer") {
      spec.kind = Kind::Integer;
    } else if (kind == "real" || kind == "numeric") {
      spec.kind = Kind::Numeric;
    } else if (kind == "string") {
      spec.kind = Kind::String;
    } else if (kind == "date") {
      spec.kind = Kind::Date;
      if (tok.size() >= 4) spec.date_pattern = std::string(strip_quotes(tok[3]));
    } else if (atype.size() >= 2 && atype.front() == '{' && atype.back() == '}') {
      spec.kind = Kind::Nominal;
      for (auto v : split_fields(std::string_view(atype).substr(1, atype.size() - 2))) {
        if (!v.empty()) spec.nominal_values.emplace(v);
      }
    } else {
      err = "Unsupported type " + atype + " for attribute " + name + ".";
      return false;
    }
    return ds.schema_.define_attribute(std::move(spec), &err);
  }

  bool parse_dense(std::string_view l, std::string& err) {
    const auto fields = split_fields(l);
    const std::size_t want = ds.schema_.size();
    if (fields.size() != want) {
      warn("line " + std::to_string(line_no) + " contains " + std::to_string(fields.size()) +
           " values but it should contain " + std::to_string(want) + " values");
      return true;
    }
    DenseRow raw;
    raw.reserve(fields.size());
    for (auto f : fields) raw.emplace_back(std::string(f));
    auto row = coerce_dense_row(ds.schema_, raw, &err);
    if (!row) return false;
    if (!ds.store_parsed(std::move(*row))) { err = ds.error(); return false; }
    return true;
  }

  bool parse_sparse(std::string_view l, std::string& err) {
    if (l.size() < 2 || l.back() != '}') {
      err = "Malformed sparse data line: " + std::string(l);
      return false;
    }
    if (ds.streaming()) {
      err = "sparse data lines cannot be read while streaming";
      return false;
    }
    NamedRow row;
    const std::string_view inner = trim(l.substr(1, l.size() - 2));
    if (!inner.empty()) {
      for (auto part : split_unescaped(inner)) {
        part = trim(part);
        std::size_t k = 0;
        while (k < part.size() && std::isdigit(static_cast<unsigned char>(part[k]))) ++k;
        std::size_t v = k;
        while (v < part.size() && std::isspace(static_cast<unsigned char>(part[v]))) ++v;
        if (k == 0 || v == k || v == part.size()) {
          err = "Malformed sparse entry '" + std::string(part) + "' in: " + std::string(l);
          return false;
        }
        std::size_t index = 0;
        bool overflow = false;
        for (std::size_t i = 0; i < k && !overflow; ++i) {
          const auto digit = static_cast<std::size_t>(part[i] - '0');
          if (index > (std::numeric_limits<std::size_t>::max() - digit) / 10) overflow = true;
          else index = index * 10 + digit;
        }
        if (overflow) {
          err = "Sparse index " + std::string(part.substr(0, k)) + " out of range (" +
                std::to_string(ds.schema_.size()) + " attributes)";
          return false;
        }
        if (index >= ds.schema_.size()) {
          err = "Sparse index " + std::to_string(index) + " out of range (" +
                std::to_string(ds.schema_.size()) + " attributes)";
          return false;
        }
        const AttributeSpec& a = ds.schema_.at(index);
        const std::string value(strip_quotes(part.substr(v)));
        if (value == kMissing) {
          row.set(a.name, Value::missing(Kind::String));
          continue;
        }
        auto val = make_value(a.kind, value, false, &err);
        if (!val) { err = "attribute " + a.name + ": " + err; return false; }
        row.set(a.name, std::move(*val));
      }
    }
    if (!ds.store_parsed(std::move(row))) { err = ds.error(); return false; }
    return true;
  }
};

ArffFsm::ArffFsm(Dataset& ds, ParserConfig cfg)
  : p_(new Impl{ds, std::move(cfg)}) {}

ArffFsm::~ArffFsm() { delete p_; }

bool ArffFsm::feed(std::string_view line) {
  ++p_->line_no;
  if (p_->stopped) return true;
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  std::string err;
  if (!p_->dispatch(line, err)) {
    err_ = "line " + std::to_string(p_->line_no) + ": " + err;
    return false;
  }
  return true;
}

void ArffFsm::finish() {
  if (p_->state == State::Comment) p_->close_comment();
}

bool ArffFsm::done() const noexcept { return p_->stopped; }
ArffFsm::State ArffFsm::state() const noexcept { return p_->state; }
std::uint64_t ArffFsm::line_no() const noexcept { return p_->line_no; }
std::uint64_t ArffFsm::warnings() const noexcept { return p_->warnings; }

}
