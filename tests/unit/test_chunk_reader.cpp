#include "arffkit/chunk_reader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(){
  const fs::path f = "tests/data/crlf.arff";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  // tiny chunks force lines to straddle reads
  ak::ChunkReader::Config cfg;
  cfg.chunk_bytes = 7;
  ak::ChunkReader r(f.string(), cfg);
  std::vector<std::string> lines;
  bool ok = r.for_each_line([&](std::string_view s){
    lines.emplace_back(s);
    return true;
  });
  if (!ok) { std::cerr << "[FAIL] chunk_reader aborted: " << r.error() << "\n"; return 1; }
  if (lines.size() != 6) { std::cerr << "[FAIL] expected 6 lines, got " << lines.size() << "\n"; return 1; }
  for (const auto& l : lines) {
    if (!l.empty() && l.back() == '\r') { std::cerr << "[FAIL] CR not stripped: " << l << "\n"; return 1; }
  }
  if (lines[0] != "@relation crlf" || lines[5] != "2,y") {
    std::cerr << "[FAIL] unexpected content: '" << lines[0] << "' / '" << lines[5] << "'\n"; return 1;
  }
  if (r.bytes_read() != fs::file_size(f)) { std::cerr << "[FAIL] bytes_read mismatch\n"; return 1; }
  if (r.lines_read() != 6) { std::cerr << "[FAIL] lines_read=" << r.lines_read() << "\n"; return 1; }

  // early stop
  ak::ChunkReader r2(f.string());
  uint64_t seen = 0;
  ok = r2.for_each_line([&](std::string_view){ return ++seen < 2; });
  if (!ok || seen != 2) { std::cerr << "[FAIL] early stop, seen=" << seen << "\n"; return 1; }

  // last line without a newline
  const fs::path tmp = fs::temp_directory_path() / "arffkit-chunk-tail.txt";
  { std::ofstream o(tmp, std::ios::binary); o << "a\nb"; }
  ak::ChunkReader r3(tmp.string());
  std::vector<std::string> tail;
  ok = r3.for_each_line([&](std::string_view s){ tail.emplace_back(s); return true; });
  std::error_code ec;
  fs::remove(tmp, ec);
  if (!ok || tail.size() != 2 || tail[1] != "b") { std::cerr << "[FAIL] unterminated last line\n"; return 1; }

  // oversize line
  ak::ChunkReader::Config small;
  small.chunk_bytes = 4;
  small.max_record_bytes = 8;
  ak::ChunkReader r4("tests/data/weather.arff", small);
  if (r4.for_each_line([](std::string_view){ return true; })) {
    std::cerr << "[FAIL] oversize line accepted\n"; return 1;
  }

  ak::ChunkReader r5("tests/data/does-not-exist.arff");
  if (r5.for_each_line([](std::string_view){ return true; }) || r5.last_error() == 0) {
    std::cerr << "[FAIL] missing file not reported\n"; return 1;
  }

  std::cout << "[PASS] lines=" << lines.size() << " bytes=" << r.bytes_read() << "\n";
  return 0;
}
