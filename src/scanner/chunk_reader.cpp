#include "arffkit/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace ak {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::string err;
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  // Emit one line; false means the callback asked to stop.
  bool emit(std::string_view line, const LineCallback& cb) {
    if (cfg.strip_cr && !line.empty() && line.back() == '\r') line.remove_suffix(1);
    ++lines;
    return cb(line);
  }

  bool for_each_line(const LineCallback& cb) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
      last_errno = errno;
      err = "cannot open " + path + ": " + std::strerror(last_errno);
      return false;
    }

    std::vector<char> buf(cfg.chunk_bytes);
    std::string carry;
    bool stop = false;

    while (!stop) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0) {
        if (std::ferror(f)) {
          last_errno = errno;
          err = "read error on " + path + ": " + std::strerror(last_errno);
          std::fclose(f);
          return false;
        }
        break;
      }
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (!stop) {
        std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          carry.append(block.substr(start));
          if (carry.size() > cfg.max_record_bytes) {
            err = "line " + std::to_string(lines + 1) + " of " + path + " exceeds " +
                  std::to_string(cfg.max_record_bytes) + " bytes";
            std::fclose(f);
            return false;
          }
          break;
        }
        if (carry.empty()) {
          stop = !emit(block.substr(start, pos - start), cb);
        } else {
          carry.append(block.substr(start, pos - start));
          stop = !emit(carry, cb);
          carry.clear();
        }
        start = pos + 1;
      }
    }

    // last line without a trailing newline
    if (!stop && !carry.empty()) (void)emit(carry, cb);

    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
int ChunkReader::last_error() const noexcept { return p_->last_errno; }
const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }

}
