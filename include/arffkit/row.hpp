#pragma once
#include "arffkit/value.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ak {

class Schema;

// Position-aligned row: one cell per attribute, in schema order.
using DenseRow = std::vector<Cell>;

// Name-keyed row (sparse shape, and the shape used for programmatic append).
// Keeps insertion order so attributes discovered while appending are added to
// the schema in a stable order.
class NamedRow {
public:
  using Entry = std::pair<std::string, Value>;

  NamedRow() = default;
  NamedRow(std::initializer_list<Entry> init);

  // Insert or replace.
  void set(std::string name, Value v);
  const Value* find(std::string_view name) const;
  bool contains(std::string_view name) const { return find(name) != nullptr; }
  bool erase(std::string_view name);

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  // Order-insensitive, like a dictionary.
  bool operator==(const NamedRow& o) const;
  bool operator!=(const NamedRow& o) const { return !(*this == o); }

private:
  std::vector<Entry> entries_;
};

using Row = std::variant<DenseRow, NamedRow>;

// Type the cells of a positional row against the schema, the way data lines
// are typed when read:
//   missing   stays Missing
//   integer   exact integer (error otherwise)
//   numeric   exact Decimal (error otherwise)
//   string    text
//   nominal   text, must be declared (error otherwise)
//   date      left as given, minus surrounding quotes (text stays undecoded)
// The row must already have one cell per attribute.
std::optional<DenseRow> coerce_dense_row(const Schema& schema, const DenseRow& raw,
                                         std::string* err = nullptr);

// Positional -> named, wrapping each cell into the kind declared for its
// attribute. Extra cells beyond the schema are ignored.
std::optional<NamedRow> to_named_row(const Schema& schema, const DenseRow& row,
                                     std::string* err = nullptr);

}
