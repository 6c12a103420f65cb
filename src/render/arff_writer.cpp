#include "arffkit/arff_writer.hpp"
#include "arffkit/date_parse.hpp"
#include "arffkit/parse_policy.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace ak {

static std::string join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

// Quote tokens containing a space unless they already start with a quote.
static std::string smart_quote(std::string s) {
  if (s.find(' ') != std::string::npos && (s.empty() || s[0] != '"')) return "\"" + s + "\"";
  return s;
}

std::string ArffWriter::esc(std::string_view s) {
  if (s.empty()) return "''";
  std::string out = "'" + std::string(s) + "'";
  // names that were already quoted keep a single pair
  std::string collapsed;
  collapsed.reserve(out.size());
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (out[i] == '\'' && i + 1 < out.size() && out[i+1] == '\'') { collapsed += '\''; ++i; continue; }
    collapsed += out[i];
  }
  return collapsed;
}

bool ArffWriter::write_line(const Row& row, Format fmt, std::optional<std::string>& out) {
  out.reset();
  err_.clear();
  switch (fmt) {
    case Format::Dense:  return write_dense(row, out);
    case Format::Sparse: return write_sparse(row, out);
  }
  err_ = "unknown format";
  return false;
}

bool ArffWriter::write_dense(const Row& row, std::optional<std::string>& out) {
  const auto* dense = std::get_if<DenseRow>(&row);
  if (!dense) {
    err_ = "dense format requires positional rows";
    return false;
  }
  std::vector<std::string> line;
  const std::size_t n = std::min(dense->size(), schema_.size());
  line.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const AttributeSpec& a = schema_.at(i);
    const Cell& c = (*dense)[i];
    switch (a.kind) {
      case Kind::Integer:
      case Kind::Numeric:
      case Kind::Nominal:
        line.push_back(cell_text(c));
        break;
      case Kind::String:
        line.push_back(cell_is_missing(c) ? std::string(kMissing) : esc(cell_text(c)));
        break;
      case Kind::Date:
        err_ = "Type " + std::string(kind_name(a.kind)) + " not supported for writing!";
        return false;
    }
  }
  out = join(line, ",");
  return true;
}

bool ArffWriter::write_sparse(const Row& row, std::optional<std::string>& out) {
  NamedRow converted;
  const NamedRow* named = std::get_if<NamedRow>(&row);
  if (!named) {
    auto n = to_named_row(schema_, std::get<DenseRow>(row), &err_);
    if (!n) return false;
    converted = std::move(*n);
    named = &converted;
  }

  std::vector<std::string> line;
  bool last_missing = false;
  for (std::size_t i = 0; i < schema_.size(); ++i) {
    const AttributeSpec& a = schema_.at(i);
    const Value* v = named->find(a.name);
    if (!v) continue;

    std::string token;
    const bool missing = v->is_missing();
    if (missing) {
      token = std::string(kMissing);
    } else {
      switch (v->kind()) {
        case Kind::String:
          token = "\"" + v->text() + "\"";
          break;
        case Kind::Date: {
          DateTime dt;
          if (auto* d = std::get_if<DateTime>(&v->payload())) {
            dt = *d;
          } else {
            auto parsed = parse_date_text(std::get<std::string>(v->payload()));
            if (!parsed) {
              err_ = "cannot parse date '" + v->text() + "' for attribute " + a.name;
              return false;
            }
            dt = *parsed;
          }
          const std::string_view pattern =
              a.kind == Kind::Date ? a.effective_date_pattern() : kDefaultDatePattern;
          auto formatted = format_date(dt, pattern);
          if (!formatted) {
            err_ = "cannot format date for attribute " + a.name + " with pattern '" +
                   std::string(pattern) + "'";
            return false;
          }
          token = std::move(*formatted);
          break;
        }
        case Kind::Integer:
        case Kind::Numeric:
        case Kind::Nominal:
          token = v->text();
          break;
      }
    }

    // out-of-set nominal values are dropped, not reported
    if (!missing && a.kind == Kind::Nominal && !a.allows(token)) continue;

    line.push_back(std::to_string(i) + " " + smart_quote(std::move(token)));
    last_missing = missing;
  }

  // Nothing but a missing value (typically an unknown class) is not worth a line.
  if (line.empty() || (line.size() == 1 && last_missing)) return true;
  out = "{" + join(line, ", ") + "}";
  return true;
}

std::string ArffWriter::write_attributes() const {
  std::string out;
  for (const auto& a : schema_.attributes()) {
    out += "@attribute " + esc(a.name) + " ";
    switch (a.kind) {
      case Kind::Integer:
      case Kind::Numeric:
      case Kind::String:
        out += kind_name(a.kind);
        break;
      case Kind::Nominal: {
        std::vector<std::string> vals;
        for (const auto& v : a.nominal_values) if (v != kMissing) vals.push_back(v);
        out += "{" + join(vals, ",") + "}";
        break;
      }
      case Kind::Date:
        out += "date \"" + std::string(a.effective_date_pattern()) + "\"";
        break;
    }
    out += "\n";
  }
  return out;
}

std::string ArffWriter::write_header() const {
  std::string out;
  for (const auto& c : schema_.comment()) out += "% " + c + "\n";
  out += "@relation " + schema_.relation() + "\n";
  out += write_attributes();
  return out;
}

}
