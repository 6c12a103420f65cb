#pragma once
#include "arffkit/arff_writer.hpp"
#include "arffkit/row.hpp"
#include "arffkit/schema.hpp"
#include "arffkit/token_arff_fsm.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ak {

class StreamSink;

struct AppendOptions {
  bool schema_only   = false;  // apply schema changes, do not keep the row
  bool update_schema = true;   // false -> no schema checks or growth
};

// Owns a schema and either an in-memory row sequence or a live output stream.
//
// In memory, appending named rows grows the schema: unknown attributes are
// added with the kind of the incoming value and unseen nominal values join
// their attribute's set. While streaming the header has already been written,
// so the schema is frozen: fields naming unknown attributes or undeclared
// nominal values are removed from the row before it is written.
//
// The first value flagged as class fixes the class attribute, which is then
// always kept last. Flagging a different attribute later is an error.
class Dataset {
public:
  Dataset();
  explicit Dataset(std::string relation, std::vector<AttributeSpec> attrs = {});
  ~Dataset();
  Dataset(Dataset&&) noexcept;
  Dataset& operator=(Dataset&&) noexcept;
  Dataset(const Dataset&) = delete;
  Dataset& operator=(const Dataset&) = delete;

  static std::optional<Dataset> parse(std::string_view text, ParserConfig cfg = {},
                                      std::string* err = nullptr);
  static std::optional<Dataset> load(const std::string& path, ParserConfig cfg = {},
                                     std::string* err = nullptr);

  // Schema-only copies carry neither rows nor the comment block.
  Dataset copy(bool schema_only = false) const;

  // Closes any open stream and resets to an empty dataset.
  void clear();

  const Schema& schema() const noexcept { return schema_; }
  const std::vector<Row>& rows() const noexcept { return rows_; }
  std::size_t size() const noexcept { return rows_.size(); }
  const std::string& source_path() const noexcept { return source_path_; }

  // Schema edits. All of them fail while streaming.
  bool set_relation(std::string relation);
  bool set_comment(std::vector<std::string> lines);
  bool define_attribute(AttributeSpec spec);
  bool set_class(std::string_view name);
  bool set_nominal_values(std::string_view name, const std::vector<std::string>& values);
  bool alphabetize_attributes();

  bool append(Row row, const AppendOptions& opt = {});

  // Writes the header and any buffered rows to `path` (or a new temp file)
  // and switches to streaming. Buffered rows move to the stream.
  bool open_stream(std::optional<std::string> class_attr = std::nullopt, std::string path = {});
  // Flushes and closes; returns the stream's path.
  std::optional<std::string> close_stream();
  bool flush();
  bool streaming() const noexcept;

  std::optional<std::string> write(const WriteOptions& opt = {}) const;
  // Defaults to the path the dataset was loaded from.
  bool save(std::string path = {}, const WriteOptions& opt = {});

  // Row i keyed by attribute name.
  std::optional<NamedRow> named_row(std::size_t i) const;

  // Decode a single predicted/serialized token for an attribute:
  //   numeric kinds -> Integer / Decimal cell
  //   nominal       -> "<index>:<value>" with a declared value
  //   "?"           -> Missing
  std::optional<Cell> attribute_value(std::string_view name, std::string_view token) const;

  // Human-readable overview: relation, attributes, rows.
  std::string describe() const;

  const std::string& error() const { return err_; }

private:
  friend class ArffFsm;

  // Grow or check the schema against a named row; trims the row while streaming.
  bool reconcile(NamedRow& named);
  bool store_parsed(Row row);
  bool emit(const Row& row);
  bool frozen(std::string_view what);
  bool fail(std::string msg) const;
  // Re-lay positional rows after the attribute list changed; new columns are missing.
  void realign(const std::vector<std::string>& before);
  std::vector<std::string> attribute_names() const;

  Schema schema_;
  std::vector<Row> rows_;
  std::unique_ptr<StreamSink> sink_;
  std::string source_path_;
  mutable std::string err_;
};

}
