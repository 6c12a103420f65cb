#pragma once
#include "arffkit/value.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ak {

struct AttributeSpec {
  std::string name;
  Kind kind = Kind::String;
  std::set<std::string> nominal_values;     // Nominal only
  std::optional<std::string> date_pattern;  // Date only; unset -> default

  std::string_view effective_date_pattern() const {
    return date_pattern ? std::string_view(*date_pattern) : kDefaultDatePattern;
  }
  bool allows(std::string_view v) const {
    return nominal_values.find(std::string(v)) != nominal_values.end();
  }

  static AttributeSpec integer(std::string name) { return {std::move(name), Kind::Integer, {}, {}}; }
  static AttributeSpec numeric(std::string name) { return {std::move(name), Kind::Numeric, {}, {}}; }
  static AttributeSpec string(std::string name)  { return {std::move(name), Kind::String, {}, {}}; }
  static AttributeSpec nominal(std::string name, std::set<std::string> values) {
    return {std::move(name), Kind::Nominal, std::move(values), {}};
  }
  static AttributeSpec date(std::string name, std::optional<std::string> pattern = std::nullopt) {
    return {std::move(name), Kind::Date, {}, std::move(pattern)};
  }
};

bool operator==(const AttributeSpec& a, const AttributeSpec& b);
inline bool operator!=(const AttributeSpec& a, const AttributeSpec& b) { return !(a == b); }

// Relation name, comment block and the ordered attribute list. If a class
// attribute is designated it is kept in the last position.
class Schema {
public:
  Schema() = default;
  explicit Schema(std::string relation) : relation_(std::move(relation)) {}

  const std::string& relation() const noexcept { return relation_; }
  void set_relation(std::string r) { relation_ = std::move(r); }

  const std::vector<std::string>& comment() const noexcept { return comment_; }
  void set_comment(std::vector<std::string> lines) { comment_ = std::move(lines); }

  const std::vector<AttributeSpec>& attributes() const noexcept { return attrs_; }
  std::size_t size() const noexcept { return attrs_.size(); }
  bool empty() const noexcept { return attrs_.empty(); }
  const AttributeSpec& at(std::size_t i) const { return attrs_.at(i); }

  const AttributeSpec* find(std::string_view name) const;
  std::optional<std::size_t> index_of(std::string_view name) const;

  // Append a declaration. Names must be unique.
  bool define_attribute(AttributeSpec spec, std::string* err = nullptr);

  // Returns true if the value was not yet declared.
  bool add_nominal_value(std::string_view name, const std::string& value);
  bool set_nominal_values(std::string_view name, const std::vector<std::string>& values,
                          std::string* err = nullptr);

  const std::optional<std::string>& class_attribute() const noexcept { return class_attr_; }

  // The first designation fixes the class attribute; naming a different one
  // later is an error. Re-designating the same name is a no-op.
  bool designate_class(std::string_view name, std::string* err = nullptr);

  // Designate and move to the end. The attribute must exist.
  bool set_class(std::string_view name, std::string* err = nullptr);

  // True when the class attribute (if any) is already last.
  bool class_is_last() const;
  void move_class_last();

  // Order by name; the class attribute stays last.
  void alphabetize();

  // Relation, attribute order/kinds/extra data and class designation.
  // The comment block does not take part.
  bool operator==(const Schema& o) const;
  bool operator!=(const Schema& o) const { return !(*this == o); }

private:
  std::string relation_;
  std::vector<std::string> comment_;
  std::vector<AttributeSpec> attrs_;
  std::optional<std::string> class_attr_;
};

}
