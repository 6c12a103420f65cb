#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ak {

// Reads a text file in fixed-size chunks and hands out complete lines.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 256 * 1024;       // 256 KiB
    std::size_t max_record_bytes = 64 * 1024 * 1024; // guard per line
    bool        strip_cr         = true;             // trim trailing '\r' (CRLF)
  };

  explicit ChunkReader(std::string path);
  ChunkReader(std::string path, Config cfg);
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Return false from the callback to stop early.
  using LineCallback = std::function<bool(std::string_view)>;

  // false on I/O error or an oversize line; see last_error()/error().
  bool for_each_line(const LineCallback& cb);

  int last_error() const noexcept;
  const std::string& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
