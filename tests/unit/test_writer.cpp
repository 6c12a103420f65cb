#include "arffkit/arff_writer.hpp"
#include "arffkit/dataset.hpp"

#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static std::string line_of(ak::ArffWriter& w, const ak::Row& row, ak::Format fmt) {
  std::optional<std::string> out;
  if (!w.write_line(row, fmt, out)) return "<error: " + w.error() + ">";
  return out ? *out : std::string("<none>");
}

static ak::Schema small_schema() {
  ak::Schema s("s");
  std::string err;
  (void)s.define_attribute(ak::AttributeSpec::numeric("a"), &err);
  (void)s.define_attribute(ak::AttributeSpec::nominal("b", {"x", "y"}), &err);
  (void)s.define_attribute(ak::AttributeSpec::string("c"), &err);
  return s;
}

static void test_esc() {
  check(ak::ArffWriter::esc("a") == "'a'", "esc wraps in single quotes");
  check(ak::ArffWriter::esc("") == "''", "esc of empty");
  check(ak::ArffWriter::esc("'q'") == "'q'", "esc does not double existing quotes");
}

static void test_header() {
  ak::Schema s = small_schema();
  s.set_comment({"made by hand"});
  std::string err;
  (void)s.define_attribute(ak::AttributeSpec::date("when"), &err);
  (void)s.define_attribute(ak::AttributeSpec::integer("n"), &err);
  ak::ArffWriter w(s);
  const std::string want =
    "% made by hand\n"
    "@relation s\n"
    "@attribute 'a' numeric\n"
    "@attribute 'b' {x,y}\n"
    "@attribute 'c' string\n"
    "@attribute 'when' date \"yyyy-MM-dd HH:mm:ss\"\n"
    "@attribute 'n' integer\n";
  check(w.write_header() == want, "header text");
}

static void test_sparse_lines() {
  ak::Schema s = small_schema();
  ak::ArffWriter w(s);

  ak::NamedRow r1{{"a", ak::Value::numeric(1.5)}, {"b", ak::Value::nominal("x")}};
  check(line_of(w, r1, ak::Format::Sparse) == "{0 1.5, 1 x}", "sparse numeric and nominal");

  ak::NamedRow r2{{"a", ak::Value::numeric(2.5)}, {"b", ak::Value::nominal("z")}};
  check(line_of(w, r2, ak::Format::Sparse) == "{0 2.5}", "out-of-set nominal omitted");

  ak::NamedRow r3{{"c", ak::Value::string("hello world")}};
  check(line_of(w, r3, ak::Format::Sparse) == "{2 \"hello world\"}", "string quoted once");

  ak::NamedRow r4{{"b", ak::Value::missing()}};
  check(line_of(w, r4, ak::Format::Sparse) == "<none>", "lone missing value writes nothing");

  ak::NamedRow r5{{"a", ak::Value::numeric(1.0)}, {"b", ak::Value::missing()}};
  check(line_of(w, r5, ak::Format::Sparse) == "{0 1, 1 ?}", "missing alongside values");

  check(line_of(w, ak::NamedRow{}, ak::Format::Sparse) == "<none>", "empty row writes nothing");

  ak::DenseRow d{ak::Cell(*ak::Decimal::parse("3.25")), ak::Cell(std::string("y")), ak::Cell(ak::Missing{})};
  check(line_of(w, d, ak::Format::Sparse) == "{0 3.25, 1 y, 2 ?}", "positional rows written sparse");
}

static void test_dense_lines() {
  ak::Schema s = small_schema();
  ak::ArffWriter w(s);
  ak::DenseRow d{ak::Cell(*ak::Decimal::parse("3.25")), ak::Cell(std::string("y")), ak::Cell(std::string("hi there"))};
  check(line_of(w, d, ak::Format::Dense) == "3.25,y,'hi there'", "dense line");
  ak::DenseRow m{ak::Cell(ak::Missing{}), ak::Cell(ak::Missing{}), ak::Cell(ak::Missing{})};
  check(line_of(w, m, ak::Format::Dense) == "?,?,?", "dense missing values");
  ak::NamedRow n{{"a", ak::Value::numeric(1.0)}};
  check(line_of(w, n, ak::Format::Dense).rfind("<error", 0) == 0, "dense needs positional rows");
}

static void test_dates() {
  ak::Schema s("d");
  std::string err;
  (void)s.define_attribute(ak::AttributeSpec::date("at"), &err);
  (void)s.define_attribute(ak::AttributeSpec::date("day", std::string("yyyy-MM-dd")), &err);
  ak::ArffWriter w(s);

  ak::NamedRow r{{"at", ak::Value::date_text("2020-01-02 03:04:05")},
                 {"day", ak::Value::date(ak::DateTime{2021, 3, 4, 0, 0, 0})}};
  check(line_of(w, r, ak::Format::Sparse) == "{0 \"2020-01-02 03:04:05\", 1 2021-03-04}",
        "dates formatted with their pattern");

  ak::NamedRow bad{{"at", ak::Value::date_text("yesterday")}};
  check(line_of(w, bad, ak::Format::Sparse).find("cannot parse date") != std::string::npos,
        "undecodable date text is an error");

  ak::DenseRow d{ak::Cell(std::string("2020-01-02 03:04:05")), ak::Cell(ak::Missing{})};
  check(line_of(w, d, ak::Format::Dense) == "<error: Type date not supported for writing!>",
        "dense writing rejects dates");
}

static void test_round_trip() {
  std::string err;
  auto ds = ak::Dataset::load("tests/data/weather.arff", {}, &err);
  if (!ds) { std::cerr << "[ERR] weather.arff: " << err << "\n"; ++failures; return; }

  ak::WriteOptions dense;
  dense.format = ak::Format::Dense;
  auto text = ds->write(dense);
  check(text.has_value(), "dense write");
  if (!text) return;
  auto again = ak::Dataset::parse(*text, {}, &err);
  check(again && again->schema() == ds->schema(), "schema survives a dense round trip");
  check(again && again->schema().comment() == ds->schema().comment(), "comment survives");
  check(again && again->rows() == ds->rows(), "rows survive a dense round trip");

  auto sparse = ds->write();
  auto reparsed = sparse ? ak::Dataset::parse(*sparse, {}, &err) : std::nullopt;
  auto sparse2 = reparsed ? reparsed->write() : std::nullopt;
  check(sparse && sparse2 && *sparse == *sparse2, "sparse output is stable");

  ak::WriteOptions both;
  both.schema_only = true;
  both.data_only = true;
  check(!ds->write(both), "schema_only with data_only is rejected");

  ak::WriteOptions header;
  header.schema_only = true;
  auto h = ds->write(header);
  check(h && h->find("@data") == std::string::npos, "schema-only write has no @data");
}

int main() {
  test_esc();
  test_header();
  test_sparse_lines();
  test_dense_lines();
  test_dates();
  test_round_trip();
  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] writer\n";
  return 0;
}
