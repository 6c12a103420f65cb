#include "arffkit/value.hpp"
#include "arffkit/parse_policy.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace ak {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const ParsePolicy kPolicy{};

bool fail(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

bool is_integral_double(double d) {
  return std::isfinite(d) && std::floor(d) == d &&
         d >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
         d < static_cast<double>(std::numeric_limits<std::int64_t>::max());
}

Cell payload_to_cell(const Payload& p) {
  return std::visit([](const auto& x) -> Cell {
    return Cell(std::in_place_type<std::decay_t<decltype(x)>>, x);
  }, p);
}

bool check_arith(const Value& a, const Value* b, std::string* err) {
  if (a.kind() != Kind::Integer && a.kind() != Kind::Numeric)
    return fail(err, "arithmetic is not defined for " + std::string(kind_name(a.kind())) + " values");
  if (a.is_missing() || (b && b->is_missing()))
    return fail(err, "arithmetic on a missing value");
  if (b && b->kind() != a.kind())
    return fail(err, "cannot combine " + std::string(kind_name(a.kind())) + " with " +
                         std::string(kind_name(b->kind())));
  return true;
}

double as_double(const Value& v) {
  if (auto* i = std::get_if<std::int64_t>(&v.payload())) return static_cast<double>(*i);
  return std::get<double>(v.payload());
}

}

std::string_view kind_name(Kind k) {
  switch (k) {
    case Kind::Integer: return "integer";
    case Kind::Numeric: return "numeric";
    case Kind::String:  return "string";
    case Kind::Nominal: return "nominal";
    case Kind::Date:    return "date";
  }
  return "unknown";
}

// --- Decimal

std::optional<Decimal> Decimal::parse(std::string_view s) {
  auto text = kPolicy.parse_decimal(s);
  if (!text) return std::nullopt;
  return Decimal(std::move(*text));
}

Decimal Decimal::from_integer(std::int64_t v) { return Decimal(std::to_string(v)); }

Decimal Decimal::from_double(double v) { return Decimal(format_double(v)); }

double Decimal::to_double() const {
  auto d = kPolicy.parse_number(text_);
  return d ? *d : 0.0;
}

// --- Value

Value Value::missing(Kind kind, bool cls) { return Value(kind, Missing{}, cls); }
Value Value::integer(std::int64_t v, bool cls) { return Value(Kind::Integer, v, cls); }
Value Value::numeric(double v, bool cls) { return Value(Kind::Numeric, v, cls); }
Value Value::string(std::string v, bool cls) {
  if (v == kMissing) return missing(Kind::String, cls);
  return Value(Kind::String, std::move(v), cls);
}
Value Value::nominal(std::string v, bool cls) {
  if (v == kMissing) return missing(Kind::Nominal, cls);
  return Value(Kind::Nominal, std::move(v), cls);
}
Value Value::date(DateTime v, bool cls) { return Value(Kind::Date, v, cls); }
Value Value::date_text(std::string v, bool cls) {
  if (v == kMissing) return missing(Kind::Date, cls);
  return Value(Kind::Date, std::move(v), cls);
}

Value Value::with_class(bool cls) const { return Value(kind_, payload_, cls); }

std::string Value::text() const {
  return std::visit(overloaded{
    [](const Missing&) { return std::string(kMissing); },
    [](std::int64_t i) { return std::to_string(i); },
    [](double d) { return format_double(d); },
    [](const std::string& s) { return s; },
    [](const DateTime& dt) { return iso_text(dt); },
  }, payload_);
}

static std::optional<std::int64_t> checked_add(std::int64_t a, std::int64_t b, std::string* err) {
  if ((b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) ||
      (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b)) {
    fail(err, "integer overflow adding " + std::to_string(b) + " to " + std::to_string(a));
    return std::nullopt;
  }
  return a + b;
}

std::optional<Value> Value::plus(const Value& other, std::string* err) const {
  if (!check_arith(*this, &other, err)) return std::nullopt;
  if (kind_ == Kind::Integer) {
    auto sum = checked_add(std::get<std::int64_t>(payload_), std::get<std::int64_t>(other.payload_), err);
    if (!sum) return std::nullopt;
    return integer(*sum, cls_);
  }
  return numeric(as_double(*this) + as_double(other), cls_);
}

std::optional<Value> Value::plus(double other, std::string* err) const {
  if (!check_arith(*this, nullptr, err)) return std::nullopt;
  if (kind_ == Kind::Integer) {
    if (!is_integral_double(other)) {
      fail(err, "cannot add non-integral " + format_double(other) + " to an integer value");
      return std::nullopt;
    }
    auto sum = checked_add(std::get<std::int64_t>(payload_), static_cast<std::int64_t>(other), err);
    if (!sum) return std::nullopt;
    return integer(*sum, cls_);
  }
  return numeric(as_double(*this) + other, cls_);
}

bool Value::accumulate(const Value& other, std::string* err) {
  auto r = plus(other, err);
  if (!r) return false;
  payload_ = r->payload_;
  return true;
}

bool Value::accumulate(double other, std::string* err) {
  auto r = plus(other, err);
  if (!r) return false;
  payload_ = r->payload_;
  return true;
}

std::optional<Value> Value::divided_by(const Value& other, std::string* err) const {
  if (kind_ != Kind::Numeric) {
    fail(err, "division is only defined for numeric values");
    return std::nullopt;
  }
  if (!check_arith(*this, &other, err)) return std::nullopt;
  return divided_by(as_double(other), err);
}

std::optional<Value> Value::divided_by(double other, std::string* err) const {
  if (kind_ != Kind::Numeric) {
    fail(err, "division is only defined for numeric values");
    return std::nullopt;
  }
  if (!check_arith(*this, nullptr, err)) return std::nullopt;
  if (other == 0.0) {
    fail(err, "division by zero");
    return std::nullopt;
  }
  return numeric(as_double(*this) / other, cls_);
}

bool Value::divide_by(const Value& other, std::string* err) {
  auto r = divided_by(other, err);
  if (!r) return false;
  payload_ = r->payload_;
  return true;
}

bool Value::divide_by(double other, std::string* err) {
  auto r = divided_by(other, err);
  if (!r) return false;
  payload_ = r->payload_;
  return true;
}

bool operator==(const Value& a, const Value& b) {
  const Payload& pa = a.payload();
  const Payload& pb = b.payload();
  const bool na = std::holds_alternative<std::int64_t>(pa) || std::holds_alternative<double>(pa);
  const bool nb = std::holds_alternative<std::int64_t>(pb) || std::holds_alternative<double>(pb);
  if (na && nb) return as_double(a) == as_double(b);
  return pa == pb;
}

// --- Cells

bool cell_is_missing(const Cell& c) {
  return std::visit(overloaded{
    [](const Missing&) { return true; },
    [](const std::string& s) { return s == kMissing; },
    [](const Value& v) { return v.is_missing(); },
    [](const auto&) { return false; },
  }, c);
}

std::string cell_text(const Cell& c) {
  return std::visit(overloaded{
    [](const Missing&) { return std::string(kMissing); },
    [](std::int64_t i) { return std::to_string(i); },
    [](const Decimal& d) { return d.text(); },
    [](double d) { return format_double(d); },
    [](const std::string& s) { return s; },
    [](const DateTime& dt) { return iso_text(dt); },
    [](const Value& v) { return v.text(); },
  }, c);
}

std::optional<Value> make_value(Kind kind, const Cell& raw, bool cls, std::string* err) {
  if (auto* v = std::get_if<Value>(&raw))
    return make_value(kind, payload_to_cell(v->payload()), cls || v->cls(), err);
  if (cell_is_missing(raw)) return Value::missing(kind, cls);

  auto bad = [&](std::string_view why) -> std::optional<Value> {
    fail(err, "cannot convert '" + cell_text(raw) + "' to " + std::string(kind_name(kind)) +
                  (why.empty() ? std::string() : ": " + std::string(why)));
    return std::nullopt;
  };

  switch (kind) {
    case Kind::Integer:
      return std::visit(overloaded{
        [&](std::int64_t i) -> std::optional<Value> { return Value::integer(i, cls); },
        [&](const Decimal& d) -> std::optional<Value> {
          if (auto i = kPolicy.parse_integer(d.text())) return Value::integer(*i, cls);
          if (is_integral_double(d.to_double()))
            return Value::integer(static_cast<std::int64_t>(d.to_double()), cls);
          return bad("not integral");
        },
        [&](double d) -> std::optional<Value> {
          if (!is_integral_double(d)) return bad("not integral");
          return Value::integer(static_cast<std::int64_t>(d), cls);
        },
        [&](const std::string& s) -> std::optional<Value> {
          if (auto i = kPolicy.parse_integer(s)) return Value::integer(*i, cls);
          return bad("not an integer literal");
        },
        [&](const auto&) -> std::optional<Value> { return bad(""); },
      }, raw);

    case Kind::Numeric:
      return std::visit(overloaded{
        [&](std::int64_t i) -> std::optional<Value> { return Value::numeric(static_cast<double>(i), cls); },
        [&](const Decimal& d) -> std::optional<Value> { return Value::numeric(d.to_double(), cls); },
        [&](double d) -> std::optional<Value> { return Value::numeric(d, cls); },
        [&](const std::string& s) -> std::optional<Value> {
          if (auto d = kPolicy.parse_number(s)) return Value::numeric(*d, cls);
          return bad("not a number");
        },
        [&](const auto&) -> std::optional<Value> { return bad(""); },
      }, raw);

    case Kind::String:
      return Value::string(cell_text(raw), cls);

    case Kind::Nominal:
      return Value::nominal(cell_text(raw), cls);

    case Kind::Date:
      return std::visit(overloaded{
        [&](const DateTime& dt) -> std::optional<Value> { return Value::date(dt, cls); },
        [&](const std::string& s) -> std::optional<Value> { return Value::date_text(s, cls); },
        [&](const auto&) -> std::optional<Value> { return bad("expected a calendar value or text"); },
      }, raw);
  }
  return bad("unknown kind");
}

std::optional<Value> wrap_value(const Cell& raw, bool try_numeric) {
  if (auto* v = std::get_if<Value>(&raw)) return *v;
  if (cell_is_missing(raw)) return Value::missing(Kind::String);
  if (auto* s = std::get_if<std::string>(&raw)) return Value::string(*s);
  if (try_numeric) {
    if (auto v = make_value(Kind::Numeric, raw)) return v;
  }
  if (auto v = make_value(Kind::Integer, raw)) return v;
  if (auto v = make_value(Kind::Date, raw)) return v;
  return std::nullopt;
}

}
