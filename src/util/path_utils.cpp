#include "arffkit/path_utils.hpp"
#include <cctype>
#include <cstdlib>
#include <vector>
#if defined(_WIN32)
  #include <io.h>
#else
  #include <unistd.h>
#endif

namespace ak {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".arff") return FileFormat::ARFF;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  return FileFormat::Unknown;
}

std::string make_temp_file(std::string_view prefix) {
  std::error_code ec;
  const auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) return {};
  std::string tmpl = (dir / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
#if defined(_WIN32)
  if (_mktemp_s(buf.data(), buf.size()) != 0) return {};
  return std::string(buf.data());
#else
  int fd = ::mkstemp(buf.data());
  if (fd < 0) return {};
  ::close(fd);
  return std::string(buf.data());
#endif
}

}
