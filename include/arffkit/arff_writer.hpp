#pragma once
#include "arffkit/row.hpp"
#include "arffkit/schema.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ak {

enum class Format { Dense, Sparse };

struct WriteOptions {
  Format format    = Format::Sparse;
  bool schema_only = false;  // header only, no @data
  bool data_only   = false;  // @data and rows only
};

// Serializes rows and headers against a schema.
class ArffWriter {
public:
  explicit ArffWriter(const Schema& schema) : schema_(schema) {}

  // One data line. Returns false on a fatal error (see error()).
  // `out` is left empty when the row carries nothing worth writing.
  bool write_line(const Row& row, Format fmt, std::optional<std::string>& out);

  // Comment block, @relation and @attribute lines, newline terminated.
  std::string write_header() const;
  std::string write_attributes() const;

  const std::string& error() const { return err_; }

  // Single-quote a name or string value.
  static std::string esc(std::string_view s);

private:
  bool write_dense(const Row& row, std::optional<std::string>& out);
  bool write_sparse(const Row& row, std::optional<std::string>& out);

  const Schema& schema_;
  std::string err_;
};

}
