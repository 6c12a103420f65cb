#include "arffkit/schema.hpp"
#include <iostream>
#include <string>
#include <vector>

static std::vector<std::string> names(const ak::Schema& s) {
  std::vector<std::string> out;
  for (const auto& a : s.attributes()) out.push_back(a.name);
  return out;
}

int main() {
  bool ok = true;
  std::string err;

  ak::Schema s("iris");
  ok &= s.define_attribute(ak::AttributeSpec::nominal("class", {"setosa", "virginica"}), &err);
  ok &= s.define_attribute(ak::AttributeSpec::numeric("sepal"), &err);
  ok &= s.define_attribute(ak::AttributeSpec::numeric("petal"), &err);
  if (!ok) { std::cerr << "[FAIL] define_attribute: " << err << "\n"; return 1; }

  if (s.define_attribute(ak::AttributeSpec::string("sepal"), &err)) {
    std::cerr << "[FAIL] duplicate attribute accepted\n"; ok = false;
  }

  if (!s.set_class("class", &err) || names(s) != std::vector<std::string>{"sepal", "petal", "class"}) {
    std::cerr << "[FAIL] set_class should move the class last\n"; ok = false;
  }
  if (s.designate_class("petal", &err) ||
      err != "Attempting to set class to \"petal\" when it has already been set to \"class\"") {
    std::cerr << "[FAIL] conflicting class: " << err << "\n"; ok = false;
  }
  if (!s.designate_class("class", &err)) { std::cerr << "[FAIL] same class re-designated\n"; ok = false; }
  if (s.set_class("nope", &err)) { std::cerr << "[FAIL] unknown class attribute accepted\n"; ok = false; }

  s.alphabetize();
  if (names(s) != std::vector<std::string>{"petal", "sepal", "class"}) {
    std::cerr << "[FAIL] alphabetize keeps the class last\n"; ok = false;
  }

  if (!s.add_nominal_value("class", "versicolor") || s.add_nominal_value("class", "versicolor")) {
    std::cerr << "[FAIL] add_nominal_value reports new values only\n"; ok = false;
  }
  if (s.set_nominal_values("sepal", {"a"}, &err)) {
    std::cerr << "[FAIL] nominal values on a numeric attribute\n"; ok = false;
  }
  if (!s.find("class")->allows("versicolor")) { std::cerr << "[FAIL] allows\n"; ok = false; }

  ak::Schema t = s;
  t.set_comment({"differs only in comment"});
  if (t != s) { std::cerr << "[FAIL] comment must not take part in equality\n"; ok = false; }

  auto d1 = ak::AttributeSpec::date("at");
  auto d2 = ak::AttributeSpec::date("at", std::string(ak::kDefaultDatePattern));
  if (d1 != d2) { std::cerr << "[FAIL] default date pattern equality\n"; ok = false; }

  if (!ok) return 1;
  std::cout << "[PASS] schema\n";
  return 0;
}
