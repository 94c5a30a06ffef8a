#pragma once

#include <xpull/error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace xpull {

  // Names of the open elements, stored back to back in one string.
  class tag_stack {
    std::string names_;
    std::vector<std::size_t> starts_;

  public:
    void
    push(std::string_view name);

    // Pops the innermost name. With check set, a name other than the
    // innermost one is mismatched_end_tag and the stack is left unchanged.
    void
    pop(std::string_view name, bool check = true,
        std::size_t position = xml_error::npos);

    // Throws unclosed_element unless the stack is empty
    void
    finish(std::size_t position = xml_error::npos) const;

    std::string_view
    top() const;

    std::size_t
    depth() const {
      return starts_.size();
    }

    bool
    empty() const {
      return starts_.empty();
    }

    void
    clear();
  };

} // namespace xpull
