#include "arffkit/chunk_reader.hpp"
#include "arffkit/dataset.hpp"
#include "arffkit/parse_policy.hpp"
#include "arffkit/path_utils.hpp"
#if defined(ARFFKIT_WITH_JSONL)
  #include "arffkit/jsonl_rows_simdjson.hpp"
#endif

#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFail = 1;
constexpr int kExitUsage = 2;

struct Cli {
  ak::Format format = ak::Format::Sparse;
  bool schema_only = false;
  bool alphabetize = false;
  bool describe = false;
  bool stream = false;
  std::string out;                 // empty -> stdout (or a temp file when streaming)
  std::optional<std::string> cls;
  std::string jsonl;
  std::string schema;              // ARFF file whose header seeds a JSONL import
  std::string relation = "data";
  std::vector<std::string> inputs;
};

void usage(std::ostream& os) {
  os <<
    "Usage: arffkit [--format=sparse|dense] [--schema-only] [--out=FILE] [--class=NAME]\n"
    "               [--alphabetize] [--describe] <input.arff>\n"
    "       arffkit --jsonl=rows.jsonl [--relation=NAME] [--schema=FILE.arff]\n"
    "               [--class=NAME] [--stream] [--out=FILE]\n";
}

// Returns nullopt on a usage error (already reported).
std::optional<Cli> parse_cli(int argc, char** argv, bool* help) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--format=", &v)) {
      if (v == "sparse") c.format = ak::Format::Sparse;
      else if (v == "dense") c.format = ak::Format::Dense;
      else { std::cerr << "[arffkit] unknown format: " << v << "\n"; return std::nullopt; }
      continue;
    }
    if (eat("--class=", &v)) { c.cls = v; continue; }
    if (eat("--out=", &c.out)) continue;
    if (eat("--jsonl=", &c.jsonl)) continue;
    if (eat("--schema=", &c.schema)) continue;
    if (eat("--relation=", &c.relation)) continue;
    if (a == "--schema-only") { c.schema_only = true; continue; }
    if (a == "--alphabetize") { c.alphabetize = true; continue; }
    if (a == "--describe")    { c.describe = true; continue; }
    if (a == "--stream")      { c.stream = true; continue; }
    if (a == "-h" || a == "--help") { *help = true; return c; }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[arffkit] unknown option: " << a << "\n";
      return std::nullopt;
    }
    c.inputs.push_back(a);
  }

  if (c.jsonl.empty()) {
    if (c.inputs.size() != 1) {
      std::cerr << "[arffkit] expected exactly one input file\n";
      return std::nullopt;
    }
  } else if (!c.inputs.empty()) {
    std::cerr << "[arffkit] --jsonl takes no positional input\n";
    return std::nullopt;
  }
  if (c.stream && c.jsonl.empty()) {
    std::cerr << "[arffkit] --stream only applies to --jsonl imports\n";
    return std::nullopt;
  }
  return c;
}

bool emit(const ak::Dataset& ds, const std::string& out, const ak::WriteOptions& opt) {
  auto text = ds.write(opt);
  if (!text) {
    std::cerr << "[arffkit] write failed: " << ds.error() << "\n";
    return false;
  }
  if (out.empty()) {
    std::cout << *text;
    return static_cast<bool>(std::cout);
  }
  if (!ak::ensure_parent_dirs(out)) {
    std::cerr << "[arffkit] cannot create directories for " << out << "\n";
    return false;
  }
  std::ofstream f(out, std::ios::binary);
  f << *text;
  if (!f) {
    std::cerr << "[arffkit] failed to write " << out << "\n";
    return false;
  }
  return true;
}

int convert_arff(const Cli& cli) {
  const std::string& path = cli.inputs.front();
  if (ak::detect_format(path) != ak::FileFormat::ARFF)
    std::cerr << "[arffkit] warning: " << path << " does not have an .arff extension\n";

  ak::ParserConfig pcfg;
  pcfg.schema_only = cli.schema_only;
  std::string err;
  auto ds = ak::Dataset::load(path, pcfg, &err);
  if (!ds) {
    std::cerr << "[arffkit] " << err << "\n";
    return kExitFail;
  }
  if (cli.cls && !ds->set_class(*cli.cls)) {
    std::cerr << "[arffkit] " << ds->error() << "\n";
    return kExitFail;
  }
  if (cli.alphabetize && !ds->alphabetize_attributes()) {
    std::cerr << "[arffkit] " << ds->error() << "\n";
    return kExitFail;
  }

  if (cli.describe) {
    std::cout << ds->describe();
    return kExitOk;
  }

  ak::WriteOptions wopt;
  wopt.format = cli.format;
  wopt.schema_only = cli.schema_only;
  return emit(*ds, cli.out, wopt) ? kExitOk : kExitFail;
}

#if defined(ARFFKIT_WITH_JSONL)
int import_jsonl(const Cli& cli) {
  ak::Dataset ds(cli.relation);
  if (!cli.schema.empty()) {
    ak::ParserConfig pcfg;
    pcfg.schema_only = true;
    std::string err;
    auto seed = ak::Dataset::load(cli.schema, pcfg, &err);
    if (!seed) {
      std::cerr << "[arffkit] " << err << "\n";
      return kExitFail;
    }
    ds = std::move(*seed);
  }

  if (cli.stream && !ds.open_stream(cli.cls, cli.out)) {
    std::cerr << "[arffkit] " << ds.error() << "\n";
    return kExitFail;
  }

  ak::JsonlConfig jcfg;
  if (cli.cls) jcfg.class_key = *cli.cls;
  ak::JsonlRowReader rows(ds.schema(), jcfg);

  ak::ChunkReader reader(cli.jsonl);
  std::uint64_t line_no = 0;
  std::string failure;
  const bool read_ok = reader.for_each_line([&](std::string_view line) {
    ++line_no;
    if (ak::trim(line).empty()) return true;
    auto row = rows.parse_line(line);
    if (!row) {
      failure = "line " + std::to_string(line_no) + ": " + rows.error();
      return false;
    }
    if (!ds.append(std::move(*row))) {
      failure = "line " + std::to_string(line_no) + ": " + ds.error();
      return false;
    }
    return true;
  });
  if (!read_ok && failure.empty()) failure = reader.error();
  if (!failure.empty()) {
    std::cerr << "[arffkit] " << cli.jsonl << ": " << failure << "\n";
    return kExitFail;
  }

  if (cli.stream) {
    auto path = ds.close_stream();
    if (!path) {
      std::cerr << "[arffkit] " << ds.error() << "\n";
      return kExitFail;
    }
    std::cerr << "[arffkit] streamed " << line_no << " lines -> " << *path << "\n";
    return kExitOk;
  }

  if (cli.cls && !ds.set_class(*cli.cls)) {
    std::cerr << "[arffkit] " << ds.error() << "\n";
    return kExitFail;
  }
  return emit(ds, cli.out, ak::WriteOptions{}) ? kExitOk : kExitFail;
}
#endif

}

int main(int argc, char** argv) {
  bool help = false;
  auto cli = parse_cli(argc, argv, &help);
  if (help) {
    usage(std::cout);
    return kExitOk;
  }
  if (!cli) {
    usage(std::cerr);
    return kExitUsage;
  }

  if (!cli->jsonl.empty()) {
#if defined(ARFFKIT_WITH_JSONL)
    return import_jsonl(*cli);
#else
    std::cerr << "[arffkit] built without JSONL support (ARFFKIT_ENABLE_JSONL=OFF)\n";
    return kExitUsage;
#endif
  }
  return convert_arff(*cli);
}
