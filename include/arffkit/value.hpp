#pragma once
#include "arffkit/date_parse.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ak {

enum class Kind { Integer, Numeric, String, Nominal, Date };

// ARFF keyword for a kind ("integer", "numeric", ...).
std::string_view kind_name(Kind k);

struct Missing {
  bool operator==(const Missing&) const { return true; }
  bool operator!=(const Missing&) const { return false; }
};

// Exact decimal as read from a numeric column. Keeps the validated digits so
// that writing it back reproduces the input text.
class Decimal {
public:
  Decimal() : text_("0") {}
  static std::optional<Decimal> parse(std::string_view s);
  static Decimal from_integer(std::int64_t v);
  static Decimal from_double(double v);

  const std::string& text() const noexcept { return text_; }
  double to_double() const;

  bool operator==(const Decimal& o) const { return to_double() == o.to_double(); }
  bool operator!=(const Decimal& o) const { return !(*this == o); }

private:
  explicit Decimal(std::string text) : text_(std::move(text)) {}
  std::string text_;
};

using Payload = std::variant<Missing, std::int64_t, double, std::string, DateTime>;

// A scalar tagged with its attribute kind and the class-label flag.
class Value {
public:
  Value() = default;

  static Value missing(Kind kind = Kind::String, bool cls = false);
  static Value integer(std::int64_t v, bool cls = false);
  static Value numeric(double v, bool cls = false);
  static Value string(std::string v, bool cls = false);
  static Value nominal(std::string v, bool cls = false);
  static Value date(DateTime v, bool cls = false);
  static Value date_text(std::string v, bool cls = false);

  Kind kind() const noexcept { return kind_; }
  bool cls() const noexcept { return cls_; }
  const Payload& payload() const noexcept { return payload_; }
  bool is_missing() const noexcept { return std::holds_alternative<Missing>(payload_); }

  Value with_class(bool cls) const;

  // Canonical text of the payload; "?" when missing.
  std::string text() const;

  // Integer and Numeric arithmetic. Both sides must be the same kind and
  // neither may be missing; the result keeps this value's class flag.
  std::optional<Value> plus(const Value& other, std::string* err = nullptr) const;
  std::optional<Value> plus(double other, std::string* err = nullptr) const;
  bool accumulate(const Value& other, std::string* err = nullptr);
  bool accumulate(double other, std::string* err = nullptr);

  // Numeric only.
  std::optional<Value> divided_by(const Value& other, std::string* err = nullptr) const;
  std::optional<Value> divided_by(double other, std::string* err = nullptr) const;
  bool divide_by(const Value& other, std::string* err = nullptr);
  bool divide_by(double other, std::string* err = nullptr);

private:
  Value(Kind kind, Payload payload, bool cls)
    : kind_(kind), payload_(std::move(payload)), cls_(cls) {}

  Kind kind_{Kind::String};
  Payload payload_{Missing{}};
  bool cls_{false};
};

// Compares payloads only: kind and class flag do not take part, and an
// integer equals a double of the same value.
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// An untyped raw scalar, or an already tagged Value.
using Cell = std::variant<Missing, std::int64_t, Decimal, double, std::string, DateTime, Value>;

bool cell_is_missing(const Cell& c);
std::string cell_text(const Cell& c);

// Schema-directed construction. Fails (nullopt + err) when `raw` cannot be
// represented as `kind`:
//   Integer  exact integers only
//   Numeric  anything that parses as a float
//   String   always succeeds
//   Nominal  always succeeds; set membership is checked by the consumer
//   Date     calendar values or free text
// An existing Value is re-tagged from its payload.
std::optional<Value> make_value(Kind kind, const Cell& raw, bool cls = false,
                                std::string* err = nullptr);

// Kind inference for raw scalars when no schema kind is known. Tries, in order:
// pass-through of a Value, missing -> String, text -> String, then Numeric,
// Integer and Date, keeping the first that succeeds. Integers therefore become
// Numeric unless `try_numeric` is false.
std::optional<Value> wrap_value(const Cell& raw, bool try_numeric = true);

}
