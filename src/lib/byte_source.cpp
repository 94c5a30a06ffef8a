#include <xpull/byte_source.hpp>

#include <xpull/error.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace xpull {

  namespace {

    std::size_t
    read_stream(std::istream& in, char* buffer, std::size_t size,
                const std::string& what) {
      if (size == 0 || in.eof()) return 0;
      in.read(buffer, static_cast<std::streamsize>(size));
      if (in.bad()) {
        throw xml_error(error_kind::io_error, what + ": read failed");
      }
      return static_cast<std::size_t>(in.gcount());
    }

  } // namespace

  std::size_t
  memory_source::read(char* buffer, std::size_t size) {
    std::size_t n = std::min(size, data_.size() - pos_);
    if (n > 0) std::memcpy(buffer, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }

  std::size_t
  stream_source::read(char* buffer, std::size_t size) {
    return read_stream(*in_, buffer, size, "stream_source");
  }

  file_source::file_source(const std::filesystem::path& path)
      : file_(path, std::ios::binary), path_(path) {
    if (!file_) {
      throw xml_error(error_kind::io_error,
                      "file_source: cannot open file: " + path.string());
    }
  }

  std::size_t
  file_source::read(char* buffer, std::size_t size) {
    return read_stream(file_, buffer, size, "file_source: " + path_.string());
  }

} // namespace xpull
