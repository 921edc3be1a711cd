#pragma once

#include <string>
#include <vector>

namespace docsearch_core {

/**
 * @brief Splits text into paragraph chunks.
 *
 * A paragraph ends at a blank line (empty or whitespace only). Runs of blank
 * lines count as a single break, so spacing left behind by format conversion
 * does not produce extra chunks. Every chunk is trimmed and non-empty, and
 * chunks come back in source order.
 */
class Chunker {
 public:
  static constexpr const char *SPLIT_STRATEGY = "paragraph";

  // Throws InvalidInputError when the text is empty or only whitespace.
  std::vector<std::string> chunk(const std::string &text) const;
};

}  // namespace docsearch_core
