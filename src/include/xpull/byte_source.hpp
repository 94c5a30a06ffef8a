#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string_view>

namespace xpull {

  // Ordered input bytes. read() is the only place a reader blocks.
  class byte_source {
  public:
    virtual ~byte_source() = default;

    // Copy up to size bytes into buffer; 0 means end of input.
    virtual std::size_t
    read(char* buffer, std::size_t size) = 0;
  };

  class memory_source : public byte_source {
    std::string_view data_;
    std::size_t pos_ = 0;

  public:
    explicit memory_source(std::string_view data) : data_(data) {}

    std::size_t
    read(char* buffer, std::size_t size) override;
  };

  class stream_source : public byte_source {
    std::istream* in_;

  public:
    explicit stream_source(std::istream& in) : in_(&in) {}

    std::size_t
    read(char* buffer, std::size_t size) override;
  };

  class file_source : public byte_source {
    std::ifstream file_;
    std::filesystem::path path_;

  public:
    explicit file_source(const std::filesystem::path& path);

    std::size_t
    read(char* buffer, std::size_t size) override;

    const std::filesystem::path&
    path() const {
      return path_;
    }
  };

} // namespace xpull
