#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ak {

class Dataset;

struct ParserConfig {
  char comment = '%';
  bool schema_only = false;  // stop after the @data marker
  // Non-fatal diagnostics (dropped rows). Unset -> "[arffkit] warning: ..." on std::cerr.
  std::function<void(std::string_view)> on_warning;
};

// Line-oriented ARFF reader: Comment -> Header -> Data.
// Feeds schema and rows into the dataset it was constructed with.
class ArffFsm {
public:
  enum class State { Comment, Header, Data };

  ArffFsm(Dataset& ds, ParserConfig cfg = {});
  ~ArffFsm();
  ArffFsm(const ArffFsm&) = delete;
  ArffFsm& operator=(const ArffFsm&) = delete;

  // false on a fatal error; see error().
  bool feed(std::string_view line);
  // Closes an unterminated comment block.
  void finish();

  // True once a schema-only parse has reached the data section.
  bool done() const noexcept;
  State state() const noexcept;
  std::uint64_t line_no() const noexcept;
  std::uint64_t warnings() const noexcept;
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

// Splits an @attribute line into identifiers, {brace lists} and quoted strings.
std::vector<std::string> tokenize_attribute(std::string_view line);

}
