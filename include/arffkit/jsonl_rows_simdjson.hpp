#pragma once
#include "arffkit/row.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ak {

class Schema;

struct JsonlConfig {
  std::string class_key;   // key whose value is the class label; empty = none
  bool strict = true;      // nested arrays/objects are an error; else kept as raw JSON text
};

// Turns one JSON object per line into a NamedRow. Values of keys the schema
// already declares are built with the declared kind; new keys are inferred.
class JsonlRowReader {
public:
  JsonlRowReader(const Schema& schema, JsonlConfig cfg = {});
  ~JsonlRowReader();
  JsonlRowReader(const JsonlRowReader&) = delete;
  JsonlRowReader& operator=(const JsonlRowReader&) = delete;

  std::optional<NamedRow> parse_line(std::string_view line);
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
