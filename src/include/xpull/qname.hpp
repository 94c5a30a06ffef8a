#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace xpull {

  // Owned {namespace}local name that outlives the reader's buffer. The
  // lexical prefix is kept for display and is not part of the identity.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;
    std::string prefix_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name,
          std::string prefix = {})
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)), prefix_(std::move(prefix)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    const std::string&
    prefix() const {
      return prefix_;
    }

    bool
    has_namespace() const {
      return !namespace_uri_.empty();
    }

    std::strong_ordering
    operator<=>(const qname& other) const {
      if (auto c = namespace_uri_ <=> other.namespace_uri_; c != 0) return c;
      return local_name_ <=> other.local_name_;
    }

    bool
    operator==(const qname& other) const {
      return namespace_uri_ == other.namespace_uri_ &&
             local_name_ == other.local_name_;
    }

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.namespace_uri_.empty()) { return os << q.local_name_; }
      return os << '{' << q.namespace_uri_ << '}' << q.local_name_;
    }
  };

} // namespace xpull

template <>
struct std::hash<xpull::qname> {
  std::size_t
  operator()(const xpull::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
