#include "arffkit/stream_sink.hpp"
#include "arffkit/path_utils.hpp"
#include <cerrno>
#include <cstring>

namespace ak {

StreamSink::~StreamSink() {
  if (f_) std::fclose(f_);
}

bool StreamSink::open(std::string path) {
  if (f_) { err_ = "stream already open: " + path_; return false; }
  if (path.empty()) {
    path = make_temp_file();
    if (path.empty()) { err_ = "cannot create a temporary file"; return false; }
  } else if (!ensure_parent_dirs(path)) {
    err_ = "cannot create parent directories for " + path;
    return false;
  }
  f_ = std::fopen(path.c_str(), "wb");
  if (!f_) {
    err_ = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  path_ = std::move(path);
  return true;
}

bool StreamSink::write(std::string_view text) {
  if (!f_) { err_ = "stream is not open"; return false; }
  if (text.empty()) return true;
  if (std::fwrite(text.data(), 1, text.size(), f_) != text.size()) {
    err_ = "write failed on " + path_ + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

bool StreamSink::write_line(std::string_view line) {
  return write(line) && write("\n");
}

bool StreamSink::flush() {
  if (!f_) return true;
  if (std::fflush(f_) != 0) {
    err_ = "flush failed on " + path_ + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

std::optional<std::string> StreamSink::close() {
  if (!f_) return std::nullopt;
  const bool flushed = std::fflush(f_) == 0;
  const bool closed = std::fclose(f_) == 0;
  f_ = nullptr;
  if (!flushed || !closed) {
    err_ = "close failed on " + path_ + ": " + std::strerror(errno);
    return std::nullopt;
  }
  std::string p = std::move(path_);
  path_.clear();
  return p;
}

}
