#pragma once
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace ak {

// Exclusively owned, append-only text file used while streaming rows out.
class StreamSink {
public:
  StreamSink() = default;
  ~StreamSink();
  StreamSink(const StreamSink&) = delete;
  StreamSink& operator=(const StreamSink&) = delete;

  // Empty path -> a fresh file under the temp directory.
  bool open(std::string path = {});
  bool write(std::string_view text);
  bool write_line(std::string_view line);
  bool flush();
  // Flush and close; returns the file's path.
  std::optional<std::string> close();

  bool is_open() const noexcept { return f_ != nullptr; }
  const std::string& path() const noexcept { return path_; }
  const std::string& error() const noexcept { return err_; }

private:
  std::FILE* f_{nullptr};
  std::string path_;
  std::string err_;
};

}
