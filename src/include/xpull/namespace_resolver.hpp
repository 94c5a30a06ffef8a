#pragma once

#include <xpull/attribute.hpp>
#include <xpull/event.hpp>
#include <xpull/qname.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpull {

  inline constexpr std::string_view xml_namespace_uri =
      "http://www.w3.org/XML/1998/namespace";
  inline constexpr std::string_view xmlns_namespace_uri =
      "http://www.w3.org/2000/xmlns/";

  // namespace_uri is empty-optional for names in no namespace. The views
  // are valid until the resolver is next pushed or popped.
  struct resolved_name {
    std::optional<std::string_view> namespace_uri;
    std::string_view local_name;
    std::optional<std::string_view> prefix;

    qname
    to_qname() const;
  };

  // Throws when attr is an xmlns or xmlns:p declaration that binds nothing:
  // an undecodable URI (the decode error), or malformed_attribute for
  // xmlns:p="", a declared xmlns prefix, an xml prefix bound elsewhere, or
  // a reserved URI bound to another prefix or as default namespace.
  // Other attributes pass.
  void
  check_namespace_declaration(const attribute& attr);

  // One scope per open element, innermost last. Bindings of all open
  // scopes live in a single vector; a scope is the index of its first one.
  class namespace_resolver {
    struct binding {
      std::string prefix;
      std::string uri; // empty: default namespace undeclared
    };

    std::vector<binding> bindings_;
    std::vector<std::size_t> scopes_;

  public:
    // Opens a scope with the xmlns declarations of tag. Never throws for the
    // tag's content: declarations after a malformed attribute, and
    // declarations check_namespace_declaration rejects, are not registered.
    void
    push_scope(const tag_view& tag);

    void
    pop_scope();

    std::size_t
    depth() const {
      return scopes_.size();
    }

    // Innermost binding of prefix ("" for the default namespace)
    std::optional<std::string_view>
    lookup(std::string_view prefix) const;

    // Throws unbound_prefix for a prefix with no binding in scope
    resolved_name
    resolve_element(const tag_view& tag) const;

    // Unprefixed attributes are in no namespace
    resolved_name
    resolve_attribute(const attribute& attr) const;

    void
    clear();
  };

} // namespace xpull
