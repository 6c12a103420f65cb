#include "arffkit/dataset.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss; ss << in.rdbuf();
  return ss.str();
}

// Runs the CLI and returns its exit code (-1 if it did not exit normally).
static int run(const std::string& bin, const std::string& args, const fs::path& log) {
  const std::string cmd = "\"" + bin + "\" " + args + " >\"" + log.string() + "\" 2>&1";
  const int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

int main(int argc, char** argv) {
  const std::string bin = argc > 1 ? std::string(argv[1]) : env_or("ARFFKIT_BIN", "build/arffkit");
  if (!fs::exists(bin)) { std::cerr << "[ERR] arffkit binary not found: " << bin << "\n"; return 2; }
  const fs::path in = "tests/data/weather.arff";
  if (!fs::exists(in)) { std::cerr << "[ERR] fixture not found: " << in << "\n"; return 2; }

  const fs::path work = fs::temp_directory_path() / ("arffkit-cli-" + std::to_string(std::time(nullptr)));
  fs::create_directories(work);
  const fs::path log = work / "cli.log";
  bool ok = true;

  // dense conversion round-trips
  const fs::path dense = work / "dense" / "weather.arff";
  int rc = run(bin, "--format=dense --out=\"" + dense.string() + "\" " + in.string(), log);
  if (rc != 0) { std::cerr << "[FAIL] dense convert rc=" << rc << ": " << slurp(log) << "\n"; ok = false; }
  else {
    std::string err;
    auto a = ak::Dataset::load(in.string(), {}, &err);
    auto b = ak::Dataset::load(dense.string(), {}, &err);
    if (!a || !b || a->rows() != b->rows() || a->schema() != b->schema()) {
      std::cerr << "[FAIL] dense output differs from input: " << err << "\n"; ok = false;
    } else {
      std::cout << "[PASS] dense conversion\n";
    }
  }

  // class + alphabetize reorders columns and rows together
  const fs::path sorted = work / "sorted.arff";
  rc = run(bin, "--class=outlook --alphabetize --format=dense --out=\"" + sorted.string() + "\" " + in.string(), log);
  const std::string sorted_text = rc == 0 ? slurp(sorted) : std::string();
  if (sorted_text.find("@attribute 'humidity' numeric\n@attribute 'play' {no,yes}\n"
                       "@attribute 'temperature' numeric\n@attribute 'windy' {FALSE,TRUE}\n"
                       "@attribute 'outlook' {overcast,rainy,sunny}\n@data\n85,no,85,FALSE,sunny\n")
      == std::string::npos) {
    std::cerr << "[FAIL] --class/--alphabetize output:\n" << sorted_text << slurp(log) << "\n"; ok = false;
  } else {
    std::cout << "[PASS] class and alphabetize\n";
  }

  // schema only
  const fs::path header = work / "header.arff";
  rc = run(bin, "--schema-only --out=\"" + header.string() + "\" " + in.string(), log);
  if (rc != 0 || slurp(header).find("@data") != std::string::npos ||
      slurp(header).find("@relation weather") == std::string::npos) {
    std::cerr << "[FAIL] --schema-only rc=" << rc << "\n"; ok = false;
  } else {
    std::cout << "[PASS] schema only\n";
  }

  // describe goes to stdout
  rc = run(bin, "--describe " + in.string(), log);
  if (rc != 0 || slurp(log).find("Relation weather\n  With attributes\n    outlook of type nominal") != 0) {
    std::cerr << "[FAIL] --describe: " << slurp(log) << "\n"; ok = false;
  } else {
    std::cout << "[PASS] describe\n";
  }

  // failures and usage errors
  rc = run(bin, "tests/data/bad_kind.arff", log);
  if (rc != 1 || slurp(log).find("[arffkit]") == std::string::npos) {
    std::cerr << "[FAIL] parse failure should exit 1, got " << rc << "\n"; ok = false;
  } else {
    std::cout << "[PASS] parse failure exit code\n";
  }
  rc = run(bin, "", log);
  const int rc_fmt = run(bin, "--format=xml " + in.string(), log);
  if (rc != 2 || rc_fmt != 2) {
    std::cerr << "[FAIL] usage errors should exit 2, got " << rc << " and " << rc_fmt << "\n"; ok = false;
  } else {
    std::cout << "[PASS] usage exit code\n";
  }

  std::error_code ec;
  fs::remove_all(work, ec);
  return ok ? 0 : 1;
}
