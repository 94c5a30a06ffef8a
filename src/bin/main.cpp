#include <xpull/error.hpp>
#include <xpull/event.hpp>
#include <xpull/namespace_resolver.hpp>
#include <xpull/reader.hpp>
#include <xpull/xml_escape.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

struct cli_options {
  std::string input_file;
  xpull::reader_options reader;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: xpull-dump [options] <input.xml>\n"
     << "\n"
     << "Print the structure of an XML document, one event per line.\n"
     << "\n"
     << "Options:\n"
     << "  --trim                Trim whitespace around text, drop blank "
        "text\n"
     << "  --expand-empty        Report <a/> as a start and an end tag\n"
     << "  --no-check-end-names  Do not compare end tags with start tags\n"
     << "  --check-comments      Reject '--' inside comments\n"
     << "  -h, --help            Show this help message\n"
     << "  --version             Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xpull-dump " << XPULL_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--trim") {
      opts.reader.trim_text = true;
      continue;
    }

    if (arg == "--expand-empty") {
      opts.reader.expand_empty_elements = true;
      continue;
    }

    if (arg == "--no-check-end-names") {
      opts.reader.check_end_names = false;
      continue;
    }

    if (arg == "--check-comments") {
      opts.reader.check_comments = true;
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "xpull-dump: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.input_file.empty()) {
      std::cerr << "xpull-dump: only one input file is accepted\n";
      std::exit(exit_usage);
    }
    opts.input_file = arg;
  }

  return opts;
}

namespace {

  class event_printer {
    xpull::reader& reader_;
    std::ostream& out_;
    bool had_errors_ = false;

  public:
    event_printer(xpull::reader& reader, std::ostream& out)
        : reader_(reader), out_(out) {}

    bool
    had_errors() const {
      return had_errors_;
    }

    void
    print(const xpull::event& ev) {
      std::string_view title = xpull::event_kind_name(ev);
      std::visit(
          [this, title](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, xpull::start_tag> ||
                          std::is_same_v<T, xpull::empty_tag>) {
              print_tag(title, e);
              print_attributes(e);
            } else if constexpr (std::is_same_v<T, xpull::end_tag>) {
              print_tag(title, e);
            } else if constexpr (std::is_same_v<T, xpull::text>) {
              print_text("  Text", e);
            } else if constexpr (std::is_same_v<T, xpull::declaration>) {
              print_declaration(e);
            } else if constexpr (std::is_same_v<T, xpull::end_of_input>) {
              // nothing
            } else {
              print_text(title, e);
            }
          },
          ev);
    }

  private:
    void
    indent(std::size_t extra = 0) {
      for (std::size_t i = 0; i < reader_.depth() + extra; ++i)
        out_ << "  ";
    }

    void
    report(const xpull::xml_error& e) {
      std::cerr << "xpull-dump: " << e.what() << "\n";
      had_errors_ = true;
    }

    void
    print_tag(std::string_view title, const xpull::tag_view& tag) {
      indent();
      out_ << title << ": " << tag.local_name();
      try {
        auto resolved = reader_.resolve_element(tag);
        if (resolved.namespace_uri) {
          out_ << " (ns: " << *resolved.namespace_uri << ")";
        }
      } catch (const xpull::xml_error& e) {
        if (e.kind() != xpull::error_kind::unbound_prefix) throw;
        out_ << " (unbound prefix " << tag.prefix().value_or("") << ")";
      }
      out_ << "\n";
    }

    void
    print_attributes(const xpull::tag_view& tag) {
      try {
        auto cursor = tag.attributes();
        while (auto attr = cursor.next()) {
          std::string value = attr->decode_value();
          indent(1);
          out_ << "  Attribute: " << attr->key << "=\"";
          xpull::escape_attribute(out_, value);
          out_ << "\"\n";
          xpull::check_namespace_declaration(*attr);
        }
      } catch (const xpull::xml_error& e) {
        report(e);
      }
    }

    template <typename Data>
    void
    print_text(std::string_view title, const Data& data) {
      try {
        std::string decoded = data.decode();
        indent();
        out_ << title << ": \"";
        xpull::escape_attribute(out_, decoded);
        out_ << "\"\n";
      } catch (const xpull::xml_error& e) {
        if (!xpull::is_decode_error(e.kind())) throw;
        report(e);
      }
    }

    void
    print_declaration(const xpull::declaration& decl) {
      indent();
      out_ << "Declaration\n";
      print_field("version", [&decl] { return std::optional(decl.version()); });
      print_field("encoding", [&decl] { return decl.encoding(); });
      print_field("standalone", [&decl] { return decl.standalone(); });
    }

    // Fields are printed independently; a bad one is reported and skipped.
    template <typename Get>
    void
    print_field(std::string_view name, Get get) {
      try {
        if (auto value = get()) {
          indent();
          out_ << "  " << name << "=\"" << *value << "\"\n";
        }
      } catch (const xpull::xml_error& e) {
        report(e);
      }
    }
  };

} // namespace

static int
run(const cli_options& opts) {
  std::optional<xpull::reader> reader;
  try {
    reader.emplace(xpull::reader::open(opts.input_file, opts.reader));
  } catch (const xpull::xml_error& e) {
    std::cerr << "xpull-dump: " << e.what() << "\n";
    return exit_io;
  }

  event_printer printer(*reader, std::cout);
  for (;;) {
    xpull::event ev;
    try {
      ev = reader->next();
      printer.print(ev);
    } catch (const xpull::xml_error& e) {
      std::cerr << "xpull-dump: " << opts.input_file << ": " << e.what()
                << "\n";
      return e.kind() == xpull::error_kind::io_error ? exit_io : exit_parse;
    }
    if (std::holds_alternative<xpull::end_of_input>(ev)) break;
  }

  return printer.had_errors() ? exit_parse : exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.input_file.empty()) {
    std::cerr << "xpull-dump: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
