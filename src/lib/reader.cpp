#include <xpull/reader.hpp>

#include <xpull/error.hpp>
#include <xpull/scanner.hpp>
#include <xpull/tag_stack.hpp>

#include "xml_chars.hpp"

#include <string>
#include <utility>

namespace xpull {

  namespace {

    bool
    is_fatal(error_kind kind) {
      switch (kind) {
        case error_kind::io_error:
        case error_kind::unexpected_eof:
        case error_kind::malformed_markup:
        case error_kind::mismatched_end_tag:
        case error_kind::unclosed_element:
          return true;
        default:
          return false;
      }
    }

    bool
    is_bad_comment(std::string_view raw) {
      return raw.find("--") != std::string_view::npos ||
             (!raw.empty() && raw.back() == '-');
    }

    std::unique_ptr<byte_source>
    require_source(std::unique_ptr<byte_source> source) {
      if (!source) {
        throw xml_error(error_kind::io_error, "reader: no byte source");
      }
      return source;
    }

  } // namespace

  struct reader::impl {
    std::unique_ptr<byte_source> source;
    reader_options options;
    scanner scan;
    tag_stack tags;
    namespace_resolver namespaces;

    // Scope of the last empty or end tag, popped on the next pull so that
    // the caller can still resolve that tag.
    bool pop_pending = false;
    // Second half of an expanded <a/>
    std::optional<end_tag> expanded_end;

    std::size_t event_depth = 0;
    bool finished = false;
    std::optional<error_kind> failure;

    impl(std::unique_ptr<byte_source> src, const reader_options& opts)
        : source(require_source(std::move(src))), options(opts),
          scan(*source, opts.chunk_size) {}

    event
    advance() {
      if (pop_pending) {
        namespaces.pop_scope();
        pop_pending = false;
      }

      if (expanded_end) {
        end_tag tag = *expanded_end;
        expanded_end.reset();
        tags.pop(tag.name(), true, scan.position());
        event_depth = tags.depth();
        pop_pending = true;
        return tag;
      }

      for (;;) {
        raw_span span = scan.next_span();
        event ev = classify(span);

        if (auto* tag = std::get_if<start_tag>(&ev)) {
          event_depth = tags.depth();
          tags.push(tag->name());
          namespaces.push_scope(*tag);
          return ev;
        }

        if (auto* tag = std::get_if<empty_tag>(&ev)) {
          event_depth = tags.depth();
          if (options.expand_empty_elements) {
            tags.push(tag->name());
            expanded_end = end_tag(tag->name());
            namespaces.push_scope(*tag);
            return start_tag(tag->raw());
          }
          pop_pending = true;
          namespaces.push_scope(*tag);
          return ev;
        }

        if (auto* tag = std::get_if<end_tag>(&ev)) {
          tags.pop(tag->name(), options.check_end_names, span.position);
          event_depth = tags.depth();
          pop_pending = true;
          return ev;
        }

        event_depth = tags.depth();

        if (auto* t = std::get_if<text>(&ev); t && options.trim_text) {
          std::string_view trimmed = detail::trim(t->raw());
          if (trimmed.empty()) continue;
          return text(trimmed);
        }

        if (auto* c = std::get_if<comment>(&ev);
            c && options.check_comments && is_bad_comment(c->raw())) {
          throw xml_error(error_kind::malformed_markup,
                          "reader: '--' inside comment", span.position);
        }

        if (std::holds_alternative<end_of_input>(ev)) {
          tags.finish(span.position);
          finished = true;
        }

        return ev;
      }
    }
  };

  reader::reader(std::unique_ptr<byte_source> source,
                 const reader_options& options)
      : impl_(std::make_unique<impl>(std::move(source), options)) {}

  reader::~reader() = default;
  reader::reader(reader&&) noexcept = default;
  reader& reader::operator=(reader&&) noexcept = default;

  reader
  reader::open(const std::filesystem::path& path,
               const reader_options& options) {
    return reader(std::make_unique<file_source>(path), options);
  }

  reader
  reader::from_string(std::string_view text, const reader_options& options) {
    return reader(std::make_unique<memory_source>(text), options);
  }

  event
  reader::next() {
    if (impl_->failure) {
      throw xml_error(*impl_->failure,
                      "reader: cannot continue after an earlier " +
                          std::string(to_string(*impl_->failure)) + " error");
    }
    if (impl_->finished) return end_of_input{};

    try {
      return impl_->advance();
    } catch (const xml_error& e) {
      if (is_fatal(e.kind())) impl_->failure = e.kind();
      throw;
    }
  }

  std::size_t
  reader::depth() const {
    return impl_->event_depth;
  }

  std::size_t
  reader::open_elements() const {
    return impl_->tags.depth();
  }

  std::size_t
  reader::namespace_depth() const {
    return impl_->namespaces.depth();
  }

  std::size_t
  reader::buffer_position() const {
    return impl_->scan.position();
  }

  resolved_name
  reader::resolve_element(const tag_view& tag) const {
    return impl_->namespaces.resolve_element(tag);
  }

  resolved_name
  reader::resolve_attribute(const attribute& attr) const {
    return impl_->namespaces.resolve_attribute(attr);
  }

  std::optional<std::string_view>
  reader::namespace_uri_for_prefix(std::string_view prefix) const {
    return impl_->namespaces.lookup(prefix);
  }

  const reader_options&
  reader::options() const {
    return impl_->options;
  }

} // namespace xpull
