#pragma once

#include <xpull/reader.hpp>

#include <string>

namespace xpull {

  // Call after a start_tag. Returns the decoded text and CDATA of the
  // element, descendants included, and consumes its end tag.
  std::string
  read_text(reader& r);

  // Call after a start_tag. Consumes events up to its matching end tag.
  void
  skip_element(reader& r);

} // namespace xpull
