#include <xpull/error.hpp>
#include <xpull/event.hpp>
#include <xpull/reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using namespace xpull;

namespace {

  // "Kind:name@depth" for tags, "Kind:raw@depth" for everything else
  std::string
  describe(const reader& r, const event& ev) {
    std::string out(event_kind_name(ev));
    std::visit(
        [&out](const auto& e) {
          if constexpr (std::is_base_of_v<tag_view,
                                          std::decay_t<decltype(e)>>) {
            out += ":" + std::string(e.name());
          } else if constexpr (std::is_base_of_v<character_data,
                                                 std::decay_t<decltype(e)>>) {
            out += ":" + std::string(e.raw());
          }
        },
        ev);
    return out + "@" + std::to_string(r.depth());
  }

  std::vector<std::string>
  outline(std::string_view xml, const reader_options& options = {}) {
    auto r = reader::from_string(xml, options);
    std::vector<std::string> result;
    for (;;) {
      event ev = r.next();
      result.push_back(describe(r, ev));
      if (std::holds_alternative<end_of_input>(ev)) return result;
    }
  }

  std::optional<error_kind>
  read_all_error(std::string_view xml, const reader_options& options = {}) {
    try {
      outline(xml, options);
    } catch (const xml_error& e) {
      return e.kind();
    }
    return std::nullopt;
  }

  template <typename F>
  std::optional<error_kind>
  error_of(F&& f) {
    try {
      f();
    } catch (const xml_error& e) {
      return e.kind();
    }
    return std::nullopt;
  }

} // namespace

// ===== event sequence and depth =====

TEST_CASE("reader: element with text content", "[reader]") {
  CHECK(outline("<msg>hello</msg>") ==
        std::vector<std::string>{"Start:msg@0", "Text:hello@1", "End:msg@0",
                                 "EndOfInput@0"});
}

TEST_CASE("reader: depth of nested elements", "[reader]") {
  CHECK(outline("<a><b><c/></b></a>") ==
        std::vector<std::string>{"Start:a@0", "Start:b@1", "Empty:c@2",
                                 "End:b@1", "End:a@0", "EndOfInput@0"});
}

TEST_CASE("reader: every kind of event", "[reader]") {
  std::string xml = "<?xml version=\"1.0\"?>"
                    "<!DOCTYPE doc>"
                    "<!--c-->"
                    "<?pi data?>"
                    "<doc><![CDATA[<raw>]]>t</doc>";
  CHECK(outline(xml) ==
        std::vector<std::string>{"Declaration@0", "Document Type:doc@0",
                                 "Comment:c@0", "Processing Instruction:pi data@0",
                                 "Start:doc@0", "CDATA:<raw>@1", "Text:t@1",
                                 "End:doc@0", "EndOfInput@0"});
}

TEST_CASE("reader: end of input is repeated after the end", "[reader]") {
  auto r = reader::from_string("<a/>");
  CHECK(std::holds_alternative<empty_tag>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

TEST_CASE("reader: empty input", "[reader]") {
  CHECK(outline("") == std::vector<std::string>{"EndOfInput@0"});
}

TEST_CASE("reader: mixed content", "[reader]") {
  CHECK(outline("<p>Hello <b>world</b>!</p>") ==
        std::vector<std::string>{"Start:p@0", "Text:Hello @1", "Start:b@1",
                                 "Text:world@2", "End:b@1", "Text:!@1",
                                 "End:p@0", "EndOfInput@0"});
}

TEST_CASE("reader: open elements follow the tag stack", "[reader]") {
  auto r = reader::from_string("<a><b/></a>");
  r.next();
  CHECK(r.open_elements() == 1);
  r.next();
  CHECK(r.open_elements() == 1);
  r.next();
  CHECK(r.open_elements() == 0);
  r.next();
  CHECK(r.open_elements() == 0);
}

// ===== well-formedness =====

TEST_CASE("reader: mismatched end tag", "[reader]") {
  auto r = reader::from_string("<a><b></a>");
  r.next();
  r.next();
  try {
    r.next();
    FAIL("expected mismatched_end_tag");
  } catch (const xml_error& e) {
    CHECK(e.kind() == error_kind::mismatched_end_tag);
    CHECK(e.position() == 6);
  }
  // The reader stays failed
  CHECK(error_of([&r] { r.next(); }) == error_kind::mismatched_end_tag);
}

TEST_CASE("reader: unclosed element at end of input", "[reader]") {
  CHECK(read_all_error("<a><b></b>") == error_kind::unclosed_element);
}

TEST_CASE("reader: end tag without start tag", "[reader]") {
  CHECK(read_all_error("</a>") == error_kind::mismatched_end_tag);
}

TEST_CASE("reader: scanning errors are fatal", "[reader]") {
  CHECK(read_all_error("<a><!-- open") == error_kind::unexpected_eof);
  CHECK(read_all_error("<a b=\"<\"/>") == error_kind::malformed_markup);

  auto r = reader::from_string("<a><//a>");
  r.next();
  CHECK(error_of([&r] { r.next(); }) == error_kind::malformed_markup);
  CHECK(error_of([&r] { r.next(); }) == error_kind::malformed_markup);
}

TEST_CASE("reader: end names may go unchecked", "[reader]") {
  reader_options options;
  options.check_end_names = false;
  CHECK(outline("<a><b></a></b>", options) ==
        std::vector<std::string>{"Start:a@0", "Start:b@1", "End:a@1",
                                 "End:b@0", "EndOfInput@0"});
}

// ===== attributes =====

TEST_CASE("reader: duplicate attribute surfaces on enumeration",
          "[reader]") {
  auto r = reader::from_string(R"(<a b="1" b="2"/>)");
  event ev = r.next();
  REQUIRE(std::holds_alternative<empty_tag>(ev));

  auto cursor = std::get<empty_tag>(ev).attributes();
  CHECK(cursor.next()->value == "1");
  CHECK(error_of([&cursor] { cursor.next(); }) ==
        error_kind::duplicate_attribute);

  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

TEST_CASE("reader: malformed attribute surfaces on enumeration",
          "[reader]") {
  CHECK(outline("<r><a b></a><c d=1/></r>") ==
        std::vector<std::string>{"Start:r@0", "Start:a@1", "End:a@1",
                                 "Empty:c@1", "End:r@0", "EndOfInput@0"});

  auto r = reader::from_string(R"(<r><a xmlns:p="urn:p" b><p:x/></a></r>)");
  r.next();
  event a = r.next();
  REQUIRE(std::holds_alternative<start_tag>(a));

  auto cursor = std::get<start_tag>(a).attributes();
  CHECK(cursor.next()->key == "xmlns:p");
  CHECK(error_of([&cursor] { cursor.next(); }) ==
        error_kind::malformed_attribute);

  // Declarations before the malformed attribute are in scope
  event x = r.next();
  REQUIRE(std::holds_alternative<empty_tag>(x));
  CHECK(r.resolve_element(std::get<empty_tag>(x)).namespace_uri == "urn:p");

  CHECK(std::holds_alternative<end_tag>(r.next()));
  CHECK(std::holds_alternative<end_tag>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

TEST_CASE("reader: undecodable namespace declaration", "[reader]") {
  auto r = reader::from_string(R"(<a xmlns:p="&bogus;"><p:b/></a>)");
  event a = r.next();
  REQUIRE(std::holds_alternative<start_tag>(a));

  auto attr = std::get<start_tag>(a).find_attribute("xmlns:p");
  REQUIRE(attr.has_value());
  CHECK(error_of([&attr] { check_namespace_declaration(*attr); }) ==
        error_kind::unknown_entity);
  CHECK_FALSE(r.namespace_uri_for_prefix("p").has_value());

  event b = r.next();
  REQUIRE(std::holds_alternative<empty_tag>(b));
  CHECK(error_of([&] { r.resolve_element(std::get<empty_tag>(b)); }) ==
        error_kind::unbound_prefix);

  CHECK(std::holds_alternative<end_tag>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

TEST_CASE("reader: reserved namespace misuse does not stop reading",
          "[reader]") {
  CHECK(outline(R"(<a xmlns:p=""><b xmlns:xml="urn:x"/></a>)") ==
        std::vector<std::string>{"Start:a@0", "Empty:b@1", "End:a@0",
                                 "EndOfInput@0"});
}

// ===== namespaces =====

TEST_CASE("reader: prefixed namespace scope", "[reader][namespace]") {
  auto r = reader::from_string(R"(<a:x xmlns:a="urn:a"><a:y/></a:x>)");

  event x = r.next();
  REQUIRE(std::holds_alternative<start_tag>(x));
  CHECK(r.resolve_element(std::get<start_tag>(x)).namespace_uri == "urn:a");

  event y = r.next();
  REQUIRE(std::holds_alternative<empty_tag>(y));
  auto name = r.resolve_element(std::get<empty_tag>(y));
  CHECK(name.namespace_uri == "urn:a");
  CHECK(name.local_name == "y");
  CHECK(r.namespace_depth() == 2);

  event end = r.next();
  REQUIRE(std::holds_alternative<end_tag>(end));
  CHECK(r.namespace_depth() == 1);
  CHECK(r.resolve_element(std::get<end_tag>(end)).namespace_uri == "urn:a");

  CHECK(std::holds_alternative<end_of_input>(r.next()));
  CHECK(r.namespace_depth() == 0);
  CHECK_FALSE(r.namespace_uri_for_prefix("a").has_value());
}

TEST_CASE("reader: default namespace", "[reader][namespace]") {
  auto r = reader::from_string(
      R"(<root xmlns="http://example.org"><child/></root>)");

  event root = r.next();
  CHECK(r.resolve_element(std::get<start_tag>(root)).to_qname() ==
        qname{"http://example.org", "root"});

  event child = r.next();
  CHECK(r.resolve_element(std::get<empty_tag>(child)).to_qname() ==
        qname{"http://example.org", "child"});
}

TEST_CASE("reader: namespaced attributes", "[reader][namespace]") {
  auto r = reader::from_string(
      R"(<root xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance" )"
      R"(xsi:type="myType"/>)");

  event ev = r.next();
  const auto& tag = std::get<empty_tag>(ev);
  auto attr = tag.find_attribute("xsi:type");
  REQUIRE(attr.has_value());
  CHECK(r.resolve_attribute(*attr).to_qname() ==
        qname{"http://www.w3.org/2001/XMLSchema-instance", "type"});
  CHECK(attr->decode_value() == "myType");
}

TEST_CASE("reader: empty tag scope ends with the tag", "[reader][namespace]") {
  auto r = reader::from_string(R"(<r><a xmlns:p="urn:p"/><p:b/></r>)");
  r.next();
  event a = r.next();
  CHECK(r.resolve_element(std::get<empty_tag>(a)).namespace_uri ==
        std::nullopt);
  CHECK(r.namespace_uri_for_prefix("p") == "urn:p");

  event b = r.next();
  REQUIRE(std::holds_alternative<empty_tag>(b));
  CHECK(error_of([&] { r.resolve_element(std::get<empty_tag>(b)); }) ==
        error_kind::unbound_prefix);

  // Unbound prefixes are the caller's decision; reading goes on
  CHECK(std::holds_alternative<end_tag>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

// ===== decoding =====

TEST_CASE("reader: decode errors do not stop the reader", "[reader]") {
  auto r = reader::from_string("<a>&bogus;</a><!--x-->");
  r.next();
  event body = r.next();
  REQUIRE(std::holds_alternative<text>(body));
  CHECK(error_of([&body] { std::get<text>(body).decode(); }) ==
        error_kind::unknown_entity);

  CHECK(std::holds_alternative<end_tag>(r.next()));
  CHECK(std::holds_alternative<comment>(r.next()));
  CHECK(std::holds_alternative<end_of_input>(r.next()));
}

TEST_CASE("reader: text decodes entities", "[reader]") {
  auto r = reader::from_string("<e>a&amp;b &#x263A;</e>");
  r.next();
  event body = r.next();
  CHECK(std::get<text>(body).decode() == "a&b \xE2\x98\xBA");
}

TEST_CASE("reader: declaration fields", "[reader]") {
  auto r = reader::from_string(
      R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?><r/>)");
  event ev = r.next();
  REQUIRE(std::holds_alternative<declaration>(ev));
  const auto& decl = std::get<declaration>(ev);
  CHECK(decl.version() == "1.0");
  CHECK(decl.encoding() == std::optional<std::string>("UTF-8"));
  CHECK(decl.standalone() == std::optional<std::string>("yes"));
}

// ===== options =====

TEST_CASE("reader: trim_text drops blank text", "[reader][options]") {
  reader_options options;
  options.trim_text = true;
  CHECK(outline("<a>\n  <b>  x y  </b>\n</a>\n", options) ==
        std::vector<std::string>{"Start:a@0", "Start:b@1", "Text:x y@2",
                                 "End:b@1", "End:a@0", "EndOfInput@0"});
}

TEST_CASE("reader: expand_empty_elements", "[reader][options]") {
  reader_options options;
  options.expand_empty_elements = true;
  CHECK(outline("<a><c/></a>", options) ==
        std::vector<std::string>{"Start:a@0", "Start:c@1", "End:c@1",
                                 "End:a@0", "EndOfInput@0"});
}

TEST_CASE("reader: expanded empty tag keeps its scope until its end",
          "[reader][options]") {
  reader_options options;
  options.expand_empty_elements = true;
  auto r = reader::from_string(R"(<p:c xmlns:p="urn:p"/>)", options);

  event start = r.next();
  REQUIRE(std::holds_alternative<start_tag>(start));
  CHECK(r.resolve_element(std::get<start_tag>(start)).namespace_uri ==
        "urn:p");

  event end = r.next();
  REQUIRE(std::holds_alternative<end_tag>(end));
  CHECK(std::get<end_tag>(end).name() == "p:c");
  CHECK(r.resolve_element(std::get<end_tag>(end)).namespace_uri == "urn:p");

  CHECK(std::holds_alternative<end_of_input>(r.next()));
  CHECK(r.namespace_depth() == 0);
}

TEST_CASE("reader: check_comments", "[reader][options]") {
  reader_options options;
  options.check_comments = true;
  CHECK(read_all_error("<!-- a -- b --><r/>", options) ==
        error_kind::malformed_markup);
  CHECK(read_all_error("<!-- a ---><r/>", options) ==
        error_kind::malformed_markup);
  CHECK_FALSE(read_all_error("<!-- a - b --><r/>", options).has_value());
  CHECK_FALSE(read_all_error("<!-- a -- b --><r/>").has_value());
}

TEST_CASE("reader: small chunk size", "[reader][options]") {
  reader_options options;
  options.chunk_size = 16;
  std::string xml = "<root attr=\"a value longer than one chunk\">"
                    "text longer than sixteen bytes</root>";
  CHECK(outline(xml, options) ==
        std::vector<std::string>{"Start:root@0",
                                 "Text:text longer than sixteen bytes@1",
                                 "End:root@0", "EndOfInput@0"});
}

// ===== construction and positions =====

TEST_CASE("reader: open a missing file", "[reader]") {
  CHECK(error_of([] { reader::open("/nonexistent/dir/input.xml"); }) ==
        error_kind::io_error);
}

TEST_CASE("reader: null source", "[reader]") {
  CHECK(error_of([] { reader r(nullptr); }) == error_kind::io_error);
}

TEST_CASE("reader: buffer position follows events", "[reader]") {
  auto r = reader::from_string("<a>xy</a>");
  CHECK(r.buffer_position() == 0);
  r.next();
  CHECK(r.buffer_position() == 3);
  r.next();
  CHECK(r.buffer_position() == 5);
  r.next();
  CHECK(r.buffer_position() == 9);
}

TEST_CASE("reader: readers are movable", "[reader]") {
  auto r = reader::from_string("<a/>");
  reader moved = std::move(r);
  CHECK(std::holds_alternative<empty_tag>(moved.next()));
  CHECK(moved.options().chunk_size == reader_options{}.chunk_size);
}
