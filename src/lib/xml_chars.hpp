#pragma once

#include <cstddef>
#include <string_view>

namespace xpull::detail {

  inline bool
  is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  inline std::size_t
  skip_whitespace(std::string_view s, std::size_t pos) {
    while (pos < s.size() && is_whitespace(s[pos]))
      ++pos;
    return pos;
  }

  inline std::string_view
  trim(std::string_view s) {
    std::size_t first = skip_whitespace(s, 0);
    std::size_t last = s.size();
    while (last > first && is_whitespace(s[last - 1]))
      --last;
    return s.substr(first, last - first);
  }

  // Split "p:local" at the last ':'. The prefix is empty when there is none.
  inline std::size_t
  prefix_separator(std::string_view name) {
    return name.rfind(':');
  }

} // namespace xpull::detail
