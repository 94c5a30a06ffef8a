#include <xpull/tag_stack.hpp>

#include <string>

namespace xpull {

  void
  tag_stack::push(std::string_view name) {
    starts_.push_back(names_.size());
    names_.append(name);
  }

  void
  tag_stack::pop(std::string_view name, bool check, std::size_t position) {
    if (starts_.empty()) {
      throw xml_error(error_kind::mismatched_end_tag,
                      "tag_stack: end tag '</" + std::string(name) +
                          ">' without an open element",
                      position);
    }
    if (check && top() != name) {
      throw xml_error(error_kind::mismatched_end_tag,
                      "tag_stack: expected '</" + std::string(top()) +
                          ">', found '</" + std::string(name) + ">'",
                      position);
    }
    names_.resize(starts_.back());
    starts_.pop_back();
  }

  void
  tag_stack::finish(std::size_t position) const {
    if (starts_.empty()) return;
    throw xml_error(error_kind::unclosed_element,
                    "tag_stack: element '<" + std::string(top()) +
                        ">' is not closed",
                    position);
  }

  std::string_view
  tag_stack::top() const {
    if (starts_.empty()) return {};
    return std::string_view(names_).substr(starts_.back());
  }

  void
  tag_stack::clear() {
    names_.clear();
    starts_.clear();
  }

} // namespace xpull
