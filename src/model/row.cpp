#include "arffkit/row.hpp"
#include "arffkit/parse_policy.hpp"
#include "arffkit/schema.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace ak {

NamedRow::NamedRow(std::initializer_list<Entry> init) {
  for (const auto& e : init) set(e.first, e.second);
}

void NamedRow::set(std::string name, Value v) {
  for (auto& e : entries_) {
    if (e.first == name) { e.second = std::move(v); return; }
  }
  entries_.emplace_back(std::move(name), std::move(v));
}

const Value* NamedRow::find(std::string_view name) const {
  for (const auto& e : entries_) if (e.first == name) return &e.second;
  return nullptr;
}

bool NamedRow::erase(std::string_view name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e){ return e.first == name; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

bool NamedRow::operator==(const NamedRow& o) const {
  if (entries_.size() != o.entries_.size()) return false;
  for (const auto& e : entries_) {
    const Value* v = o.find(e.first);
    if (!v || !(*v == e.second)) return false;
  }
  return true;
}

// Payload of a Value as a raw cell; raw cells pass through.
static Cell unwrap(const Cell& c) {
  if (auto* v = std::get_if<Value>(&c)) {
    return std::visit([](const auto& x) -> Cell {
      return Cell(std::in_place_type<std::decay_t<decltype(x)>>, x);
    }, v->payload());
  }
  return c;
}

std::optional<DenseRow> coerce_dense_row(const Schema& schema, const DenseRow& raw, std::string* err) {
  if (raw.size() != schema.size()) {
    if (err) *err = "row contains " + std::to_string(raw.size()) + " values but it should contain " +
                    std::to_string(schema.size()) + " values";
    return std::nullopt;
  }

  DenseRow out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const AttributeSpec& a = schema.at(i);
    const Cell c = unwrap(raw[i]);
    if (cell_is_missing(c)) { out.emplace_back(Missing{}); continue; }

    switch (a.kind) {
      case Kind::Integer: {
        auto v = make_value(Kind::Integer, c, false, err);
        if (!v) {
          if (err) *err = "attribute " + a.name + ": " + *err;
          return std::nullopt;
        }
        out.emplace_back(std::get<std::int64_t>(v->payload()));
        break;
      }
      case Kind::Numeric: {
        std::optional<Decimal> d;
        if (auto* dec = std::get_if<Decimal>(&c)) d = *dec;
        else if (auto* i = std::get_if<std::int64_t>(&c)) d = Decimal::from_integer(*i);
        else if (auto* f = std::get_if<double>(&c)) d = Decimal::from_double(*f);
        else if (auto* s = std::get_if<std::string>(&c)) d = Decimal::parse(*s);
        if (!d) {
          if (err) *err = "Incorrect value " + cell_text(c) + " for numeric attribute " + a.name;
          return std::nullopt;
        }
        out.emplace_back(std::move(*d));
        break;
      }
      case Kind::String: {
        if (auto* s = std::get_if<std::string>(&c)) out.emplace_back(std::string(strip_quotes(*s)));
        else out.emplace_back(cell_text(c));
        break;
      }
      case Kind::Nominal: {
        std::string s = cell_text(c);
        if (!a.allows(s)) {
          if (err) {
            std::string allowed;
            for (const auto& n : a.nominal_values) { if (!allowed.empty()) allowed += ", "; allowed += n; }
            *err = "Incorrect value " + s + " for nominal attribute " + a.name + " (allowed: " + allowed + ")";
          }
          return std::nullopt;
        }
        out.emplace_back(std::move(s));
        break;
      }
      case Kind::Date:
        if (auto* s = std::get_if<std::string>(&c)) out.emplace_back(std::string(strip_quotes(*s)));
        else out.push_back(c);
        break;
    }
  }
  return out;
}

std::optional<NamedRow> to_named_row(const Schema& schema, const DenseRow& row, std::string* err) {
  NamedRow out;
  const std::size_t n = std::min(row.size(), schema.size());
  for (std::size_t i = 0; i < n; ++i) {
    const AttributeSpec& a = schema.at(i);
    const Cell& c = row[i];
    if (auto* v = std::get_if<Value>(&c)) { out.set(a.name, *v); continue; }
    if (cell_is_missing(c)) { out.set(a.name, Value::missing(Kind::String)); continue; }
    auto v = make_value(a.kind, c, false, err);
    if (!v) {
      if (err) *err = "attribute " + a.name + ": " + *err;
      return std::nullopt;
    }
    out.set(a.name, std::move(*v));
  }
  return out;
}

}
