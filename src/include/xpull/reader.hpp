#pragma once

#include <xpull/byte_source.hpp>
#include <xpull/event.hpp>
#include <xpull/namespace_resolver.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace xpull {

  struct reader_options {
    std::size_t chunk_size = 8192;
    bool trim_text = false;
    bool expand_empty_elements = false;
    bool check_end_names = true;
    bool check_comments = false;
  };

  // Pull reader over one byte source.
  //
  // Views inside an event returned by next() are valid until the following
  // call to next(). Copy them out with decode() or to_qname() to keep them.
  //
  // Structural errors (unexpected_eof, malformed_markup, mismatched_end_tag,
  // unclosed_element, io_error) leave the reader failed: every later next()
  // throws the same kind. Attribute, decode and namespace errors never
  // escape next(); they come from the attribute cursor, decode(),
  // check_namespace_declaration() and resolve_*(), and leave the reader
  // usable.
  class reader {
  public:
    explicit reader(std::unique_ptr<byte_source> source,
                    const reader_options& options = {});
    ~reader();

    reader(const reader&) = delete;
    reader&
    operator=(const reader&) = delete;
    reader(reader&&) noexcept;
    reader&
    operator=(reader&&) noexcept;

    // Throws io_error when path cannot be opened
    static reader
    open(const std::filesystem::path& path, const reader_options& options = {});

    // text must outlive the reader
    static reader
    from_string(std::string_view text, const reader_options& options = {});

    // end_of_input is returned once the input is exhausted, and again on
    // every later call.
    event
    next();

    // Open elements enclosing the last event. For <a><b><c/></b></a>:
    // Start(a)=0, Start(b)=1, Empty(c)=2, End(b)=1, End(a)=0.
    std::size_t
    depth() const;

    std::size_t
    open_elements() const;

    std::size_t
    namespace_depth() const;

    // Absolute byte offset just past the last event
    std::size_t
    buffer_position() const;

    resolved_name
    resolve_element(const tag_view& tag) const;

    resolved_name
    resolve_attribute(const attribute& attr) const;

    std::optional<std::string_view>
    namespace_uri_for_prefix(std::string_view prefix) const;

    const reader_options&
    options() const;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xpull
