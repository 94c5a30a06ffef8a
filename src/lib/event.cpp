#include <xpull/event.hpp>

#include <xpull/error.hpp>
#include <xpull/xml_escape.hpp>

#include "xml_chars.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace xpull {

  namespace {

    std::size_t
    name_end(std::string_view s) {
      std::size_t i = 0;
      while (i < s.size() && !detail::is_whitespace(s[i]))
        ++i;
      return i;
    }

    bool
    is_valid_name(std::string_view name) {
      if (name.empty()) return false;
      return std::none_of(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '=' || c == '"' || c == '\'' || c == '<' ||
               c == '>';
      });
    }

    [[noreturn]] void
    malformed(const std::string& message, std::size_t position) {
      throw xml_error(error_kind::malformed_markup, "classify: " + message,
                      position);
    }

    // Strip a known opening and closing delimiter from span bytes
    std::string_view
    inner(std::string_view bytes, std::size_t open, std::size_t close) {
      return bytes.substr(open, bytes.size() - open - close);
    }

    event
    classify_tag(std::string_view bytes, std::size_t position) {
      std::string_view content = inner(bytes, 1, 1);

      if (!content.empty() && content.front() == '/') {
        std::string_view rest = content.substr(1);
        std::size_t end = name_end(rest);
        if (!is_valid_name(rest.substr(0, end))) {
          malformed("end tag without a valid name", position);
        }
        if (!detail::trim(rest.substr(end)).empty()) {
          malformed("unexpected content in end tag '</" +
                        std::string(rest.substr(0, end)) + ">'",
                    position);
        }
        return end_tag(rest.substr(0, end));
      }

      bool empty = !content.empty() && content.back() == '/';
      if (empty) content.remove_suffix(1);

      if (!is_valid_name(content.substr(0, name_end(content)))) {
        malformed("tag without a valid name", position);
      }
      if (empty) return empty_tag(content);
      return start_tag(content);
    }

    event
    classify_pi(std::string_view bytes, std::size_t position) {
      std::string_view content = inner(bytes, 2, 2);
      std::size_t end = name_end(content);
      std::string_view target = content.substr(0, end);
      if (target.empty()) {
        malformed("processing instruction without a target", position);
      }
      if (target == "xml") return declaration(content.substr(end));
      return processing_instruction(content);
    }

  } // namespace

  tag_view::tag_view(std::string_view content)
      : content_(content), name_length_(name_end(content)) {}

  std::string_view
  tag_view::local_name() const {
    auto n = name();
    auto sep = detail::prefix_separator(n);
    if (sep == std::string_view::npos) return n;
    return n.substr(sep + 1);
  }

  std::optional<std::string_view>
  tag_view::prefix() const {
    auto n = name();
    auto sep = detail::prefix_separator(n);
    if (sep == std::string_view::npos) return std::nullopt;
    return n.substr(0, sep);
  }

  std::optional<attribute>
  tag_view::find_attribute(std::string_view key) const {
    auto cursor = attributes();
    while (auto attr = cursor.next()) {
      if (attr->key == key) return attr;
    }
    return std::nullopt;
  }

  std::string
  character_data::decode() const {
    return decode_utf8(raw_);
  }

  std::string
  text::decode() const {
    return unescape(raw());
  }

  bool
  text::is_whitespace() const {
    auto r = raw();
    return std::all_of(r.begin(), r.end(), detail::is_whitespace);
  }

  std::string_view
  processing_instruction::target() const {
    return raw().substr(0, name_end(raw()));
  }

  std::string_view
  processing_instruction::content() const {
    auto r = raw();
    return r.substr(detail::skip_whitespace(r, name_end(r)));
  }

  std::optional<attribute>
  declaration::field(std::string_view key) const {
    // Fields are looked up without duplicate checks so that each accessor
    // only fails on its own field.
    attribute_cursor cursor(content_, false);
    while (auto attr = cursor.next()) {
      if (attr->key == key) return attr;
    }
    return std::nullopt;
  }

  std::string
  declaration::version() const {
    auto v = field("version");
    if (!v) {
      throw xml_error(error_kind::malformed_declaration,
                      "declaration: missing version");
    }
    return decode_utf8(v->value);
  }

  std::optional<std::string>
  declaration::encoding() const {
    auto v = field("encoding");
    if (!v) return std::nullopt;
    return decode_utf8(v->value);
  }

  std::optional<std::string>
  declaration::standalone() const {
    auto v = field("standalone");
    if (!v) return std::nullopt;
    return decode_utf8(v->value);
  }

  event
  classify(const raw_span& span) {
    std::string_view bytes = span.bytes;
    switch (span.kind) {
      case span_kind::text:
        return text(bytes);
      case span_kind::tag:
        return classify_tag(bytes, span.position);
      case span_kind::comment:
        return comment(inner(bytes, 4, 3));
      case span_kind::cdata:
        return cdata(inner(bytes, 9, 3));
      case span_kind::processing_instruction:
        return classify_pi(bytes, span.position);
      case span_kind::doctype: {
        std::string_view content = inner(bytes, 9, 1);
        if (content.empty() || !detail::is_whitespace(content.front()) ||
            detail::trim(content).empty()) {
          malformed("DOCTYPE without a name", span.position);
        }
        return doctype(detail::trim(content));
      }
      case span_kind::end_of_input:
        return end_of_input{};
    }
    malformed("unknown span kind", span.position);
  }

  std::string_view
  event_kind_name(const event& ev) {
    return std::visit(
        [](const auto& e) -> std::string_view {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, start_tag>) {
            return "Start";
          } else if constexpr (std::is_same_v<T, empty_tag>) {
            return "Empty";
          } else if constexpr (std::is_same_v<T, end_tag>) {
            return "End";
          } else if constexpr (std::is_same_v<T, text>) {
            return "Text";
          } else if constexpr (std::is_same_v<T, cdata>) {
            return "CDATA";
          } else if constexpr (std::is_same_v<T, comment>) {
            return "Comment";
          } else if constexpr (std::is_same_v<T, processing_instruction>) {
            return "Processing Instruction";
          } else if constexpr (std::is_same_v<T, doctype>) {
            return "Document Type";
          } else if constexpr (std::is_same_v<T, declaration>) {
            return "Declaration";
          } else {
            static_assert(std::is_same_v<T, end_of_input>);
            return "EndOfInput";
          }
        },
        ev);
  }

} // namespace xpull
