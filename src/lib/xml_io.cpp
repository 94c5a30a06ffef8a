#include <xpull/xml_io.hpp>

#include <xpull/error.hpp>

#include <cstddef>
#include <variant>

namespace xpull {

  namespace {

    // Visits events up to the end tag closing the current element
    template <typename F>
    void
    walk_element(reader& r, F&& on_event) {
      std::size_t nested = 0;
      for (;;) {
        event ev = r.next();
        if (std::holds_alternative<start_tag>(ev)) {
          ++nested;
        } else if (std::holds_alternative<end_tag>(ev)) {
          if (nested == 0) return;
          --nested;
        } else if (std::holds_alternative<end_of_input>(ev)) {
          throw xml_error(error_kind::unexpected_eof,
                          "xml_io: input ended inside an element");
        }
        on_event(ev);
      }
    }

  } // namespace

  std::string
  read_text(reader& r) {
    std::string result;
    walk_element(r, [&result](const event& ev) {
      if (auto* t = std::get_if<text>(&ev)) {
        result += t->decode();
      } else if (auto* c = std::get_if<cdata>(&ev)) {
        result += c->decode();
      }
    });
    return result;
  }

  void
  skip_element(reader& r) {
    walk_element(r, [](const event&) {});
  }

} // namespace xpull
