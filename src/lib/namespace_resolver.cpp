#include <xpull/namespace_resolver.hpp>

#include <xpull/error.hpp>

#include <optional>
#include <string>
#include <utility>

namespace xpull {

  namespace {

    void
    check_declaration(std::string_view prefix, std::string_view uri) {
      std::string decl = "xmlns:" + std::string(prefix);
      if (uri.empty()) {
        throw xml_error(error_kind::malformed_attribute,
                        "namespace_resolver: '" + decl +
                            "' cannot bind an empty URI");
      }
      if (prefix == "xmlns") {
        throw xml_error(error_kind::malformed_attribute,
                        "namespace_resolver: the xmlns prefix cannot be "
                        "declared");
      }
      if ((prefix == "xml") != (uri == xml_namespace_uri)) {
        throw xml_error(error_kind::malformed_attribute,
                        "namespace_resolver: '" + decl +
                            "' rebinds the xml namespace");
      }
      if (uri == xmlns_namespace_uri) {
        throw xml_error(error_kind::malformed_attribute,
                        "namespace_resolver: '" + decl +
                            "' binds the xmlns namespace");
      }
    }

    resolved_name
    resolve_prefixed(const namespace_resolver& resolver,
                     std::optional<std::string_view> prefix,
                     std::string_view local_name, std::string_view name) {
      auto uri = resolver.lookup(*prefix);
      if (prefix->empty() || !uri) {
        throw xml_error(error_kind::unbound_prefix,
                        "namespace_resolver: unbound prefix '" +
                            std::string(*prefix) + "' in '" +
                            std::string(name) + "'");
      }
      return {uri, local_name, prefix};
    }

    // Decoded URI of an xmlns or xmlns:p attribute, nullopt for any other
    std::optional<std::string>
    declared_uri(const attribute& attr) {
      if (attr.key == "xmlns") {
        std::string uri = attr.decode_value();
        if (uri == xml_namespace_uri || uri == xmlns_namespace_uri) {
          throw xml_error(error_kind::malformed_attribute,
                          "namespace_resolver: reserved namespace used as "
                          "default namespace");
        }
        return uri;
      }
      if (attr.prefix() == "xmlns") {
        std::string uri = attr.decode_value();
        check_declaration(attr.local_name(), uri);
        return uri;
      }
      return std::nullopt;
    }

  } // namespace

  void
  check_namespace_declaration(const attribute& attr) {
    declared_uri(attr);
  }

  qname
  resolved_name::to_qname() const {
    return qname(std::string(namespace_uri.value_or("")),
                 std::string(local_name), std::string(prefix.value_or("")));
  }

  void
  namespace_resolver::push_scope(const tag_view& tag) {
    scopes_.push_back(bindings_.size());
    attribute_cursor cursor(tag.attribute_bytes(), false);
    for (;;) {
      std::optional<attribute> attr;
      try {
        attr = cursor.next();
      } catch (const xml_error&) {
        // Declarations after a malformed attribute are not registered; the
        // caller's own cursor reports the attribute.
        return;
      }
      if (!attr) return;

      try {
        if (auto uri = declared_uri(*attr)) {
          std::string_view prefix =
              attr->key == "xmlns" ? std::string_view() : attr->local_name();
          bindings_.push_back({std::string(prefix), std::move(*uri)});
        }
      } catch (const xml_error&) {
        // A rejected declaration binds nothing.
        // check_namespace_declaration reports it.
      }
    }
  }

  void
  namespace_resolver::pop_scope() {
    if (scopes_.empty()) return;
    bindings_.resize(scopes_.back());
    scopes_.pop_back();
  }

  std::optional<std::string_view>
  namespace_resolver::lookup(std::string_view prefix) const {
    if (prefix == "xml") return xml_namespace_uri;
    if (prefix == "xmlns") return xmlns_namespace_uri;
    for (auto it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
      if (it->prefix == prefix) {
        if (it->uri.empty()) return std::nullopt;
        return std::string_view(it->uri);
      }
    }
    return std::nullopt;
  }

  resolved_name
  namespace_resolver::resolve_element(const tag_view& tag) const {
    auto prefix = tag.prefix();
    if (!prefix) return {lookup(""), tag.local_name(), std::nullopt};
    return resolve_prefixed(*this, prefix, tag.local_name(), tag.name());
  }

  resolved_name
  namespace_resolver::resolve_attribute(const attribute& attr) const {
    if (attr.key == "xmlns") {
      return {xmlns_namespace_uri, attr.key, std::nullopt};
    }
    auto prefix = attr.prefix();
    if (!prefix) return {std::nullopt, attr.local_name(), std::nullopt};
    return resolve_prefixed(*this, prefix, attr.local_name(), attr.key);
  }

  void
  namespace_resolver::clear() {
    bindings_.clear();
    scopes_.clear();
  }

} // namespace xpull
