#pragma once

#include <xpull/attribute.hpp>
#include <xpull/scanner.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace xpull {

  // Bytes between "<" (or "</") and ">" (or "/>"): the name, then for start
  // and empty tags the attribute bytes.
  class tag_view {
    std::string_view content_;
    std::size_t name_length_ = 0;

  public:
    tag_view() = default;

    explicit tag_view(std::string_view content);

    std::string_view
    raw() const {
      return content_;
    }

    std::string_view
    name() const {
      return content_.substr(0, name_length_);
    }

    std::string_view
    local_name() const;

    std::optional<std::string_view>
    prefix() const;

    std::string_view
    attribute_bytes() const {
      return content_.substr(name_length_);
    }

    attribute_cursor
    attributes() const {
      return attribute_cursor(attribute_bytes());
    }

    // First attribute whose raw key equals key; walks with full checks.
    std::optional<attribute>
    find_attribute(std::string_view key) const;
  };

  class start_tag : public tag_view {
  public:
    using tag_view::tag_view;
  };

  class empty_tag : public tag_view {
  public:
    using tag_view::tag_view;
  };

  class end_tag : public tag_view {
  public:
    using tag_view::tag_view;
  };

  // Content between the delimiters of a text-like event
  class character_data {
    std::string_view raw_;

  public:
    character_data() = default;

    explicit character_data(std::string_view raw) : raw_(raw) {}

    std::string_view
    raw() const {
      return raw_;
    }

    // UTF-8 validated copy; markup other than text is never unescaped
    std::string
    decode() const;
  };

  class text : public character_data {
  public:
    using character_data::character_data;

    // Entity-decoded copy
    std::string
    decode() const;

    bool
    is_whitespace() const;
  };

  class cdata : public character_data {
  public:
    using character_data::character_data;
  };

  class comment : public character_data {
  public:
    using character_data::character_data;
  };

  class processing_instruction : public character_data {
  public:
    using character_data::character_data;

    std::string_view
    target() const;

    std::string_view
    content() const;
  };

  class doctype : public character_data {
  public:
    using character_data::character_data;
  };

  // <?xml version="..." encoding="..." standalone="..."?>
  // Each accessor parses independently, so one bad field never hides another.
  class declaration {
    std::string_view content_;

  public:
    declaration() = default;

    explicit declaration(std::string_view content) : content_(content) {}

    std::string_view
    raw() const {
      return content_;
    }

    // Throws malformed_declaration when absent
    std::string
    version() const;

    std::optional<std::string>
    encoding() const;

    std::optional<std::string>
    standalone() const;

  private:
    std::optional<attribute>
    field(std::string_view key) const;
  };

  struct end_of_input {};

  using event = std::variant<start_tag, empty_tag, end_tag, text, cdata,
                             comment, processing_instruction, doctype,
                             declaration, end_of_input>;

  // Tagged view over span.bytes; allocates nothing.
  // Throws malformed_markup for a tag or PI with no usable name.
  event
  classify(const raw_span& span);

  std::string_view
  event_kind_name(const event& ev);

} // namespace xpull
