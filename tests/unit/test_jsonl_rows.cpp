#include "arffkit/dataset.hpp"
#include "arffkit/jsonl_rows_simdjson.hpp"

#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

int main() {
  ak::Dataset ds("j", {ak::AttributeSpec::integer("n"), ak::AttributeSpec::nominal("k", {"a", "b"})});
  ak::JsonlConfig cfg;
  cfg.class_key = "k";
  ak::JsonlRowReader reader(ds.schema(), cfg);

  auto r = reader.parse_line(R"({"n": 3, "k": "a", "x": 1.25, "s": "hi", "f": false, "z": null})");
  check(r.has_value(), "object line parses: " + reader.error());
  if (r) {
    check(r->find("n")->kind() == ak::Kind::Integer && r->find("n")->text() == "3",
          "declared integer typed by schema");
    check(r->find("k")->kind() == ak::Kind::Nominal && r->find("k")->cls(), "class key flagged");
    check(r->find("x")->kind() == ak::Kind::Numeric, "undeclared number inferred as numeric");
    check(r->find("s")->kind() == ak::Kind::String, "undeclared text inferred as string");
    check(r->find("f")->text() == "false", "booleans become text");
    check(r->find("z")->is_missing(), "null is missing");
    check(ds.append(std::move(*r)), "row appends: " + ds.error());
    check(ds.schema().size() == 6 && ds.schema().class_attribute() == std::string("k") &&
          ds.schema().at(5).name == "k", "schema grew and the class stays last");
  }

  check(!reader.parse_line(R"({"n": 1.5})") && !reader.error().empty(),
        "non-integral value for an integer attribute is an error");
  check(!reader.parse_line("[1, 2, 3]") && reader.error() == "JSONL line is not an object",
        "non-object line is an error");
  check(!reader.parse_line(R"({"n": [1, 2]})"), "nested values rejected in strict mode");
  check(!reader.parse_line(R"({"n": )"), "truncated JSON is an error");

  ak::JsonlConfig lenient;
  lenient.strict = false;
  ak::JsonlRowReader loose(ds.schema(), lenient);
  auto nested = loose.parse_line(R"({"arr": [1, 2]})");
  check(nested && nested->find("arr")->text() == "[1, 2]", "nested value kept as raw JSON text");

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] jsonl rows\n";
  return 0;
}
