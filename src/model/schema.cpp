#include "arffkit/schema.hpp"

#include <algorithm>

namespace ak {

bool operator==(const AttributeSpec& a, const AttributeSpec& b) {
  if (a.name != b.name || a.kind != b.kind) return false;
  if (a.kind == Kind::Nominal) return a.nominal_values == b.nominal_values;
  if (a.kind == Kind::Date) return a.effective_date_pattern() == b.effective_date_pattern();
  return true;
}

const AttributeSpec* Schema::find(std::string_view name) const {
  for (const auto& a : attrs_) if (a.name == name) return &a;
  return nullptr;
}

std::optional<std::size_t> Schema::index_of(std::string_view name) const {
  for (std::size_t i = 0; i < attrs_.size(); ++i) if (attrs_[i].name == name) return i;
  return std::nullopt;
}

bool Schema::define_attribute(AttributeSpec spec, std::string* err) {
  if (find(spec.name)) {
    if (err) *err = "attribute '" + spec.name + "' is already defined";
    return false;
  }
  attrs_.push_back(std::move(spec));
  return true;
}

bool Schema::add_nominal_value(std::string_view name, const std::string& value) {
  auto idx = index_of(name);
  if (!idx) return false;
  return attrs_[*idx].nominal_values.insert(value).second;
}

bool Schema::set_nominal_values(std::string_view name, const std::vector<std::string>& values,
                                std::string* err) {
  auto idx = index_of(name);
  if (!idx) {
    if (err) *err = "unknown attribute '" + std::string(name) + "'";
    return false;
  }
  AttributeSpec& a = attrs_[*idx];
  if (a.kind != Kind::Nominal) {
    if (err) *err = "attribute '" + a.name + "' is " + std::string(kind_name(a.kind)) + ", not nominal";
    return false;
  }
  a.nominal_values.insert(values.begin(), values.end());
  return true;
}

bool Schema::designate_class(std::string_view name, std::string* err) {
  if (!class_attr_) {
    class_attr_ = std::string(name);
    return true;
  }
  if (*class_attr_ != name) {
    if (err) *err = "Attempting to set class to \"" + std::string(name) +
                    "\" when it has already been set to \"" + *class_attr_ + "\"";
    return false;
  }
  return true;
}

bool Schema::set_class(std::string_view name, std::string* err) {
  if (!find(name)) {
    if (err) *err = "unknown attribute '" + std::string(name) + "'";
    return false;
  }
  if (!designate_class(name, err)) return false;
  move_class_last();
  return true;
}

bool Schema::class_is_last() const {
  if (!class_attr_) return true;
  auto idx = index_of(*class_attr_);
  return !idx || *idx + 1 == attrs_.size();
}

void Schema::move_class_last() {
  if (!class_attr_) return;
  auto idx = index_of(*class_attr_);
  if (!idx) return;
  auto it = attrs_.begin() + static_cast<std::ptrdiff_t>(*idx);
  std::rotate(it, it + 1, attrs_.end());
}

void Schema::alphabetize() {
  const std::string cls = class_attr_ ? *class_attr_ : std::string();
  const bool has_cls = class_attr_.has_value();
  std::stable_sort(attrs_.begin(), attrs_.end(), [&](const AttributeSpec& a, const AttributeSpec& b) {
    const bool ca = has_cls && a.name == cls;
    const bool cb = has_cls && b.name == cls;
    if (ca != cb) return cb;
    return a.name < b.name;
  });
}

bool Schema::operator==(const Schema& o) const {
  return relation_ == o.relation_ && attrs_ == o.attrs_ && class_attr_ == o.class_attr_;
}

}
