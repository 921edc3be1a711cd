#include "docsearch_core/chunker.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

namespace {

bool is_blank(const std::string &line) {
  for (unsigned char c : line) {
    if (!std::isspace(c)) {
      return false;
    }
  }
  return true;
}

std::string trim(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace

std::vector<std::string> Chunker::chunk(const std::string &text) const {
  if (is_blank(text)) {
    std::clog << "[Chunker] Warning: text is empty" << std::endl;
    throw InvalidInputError("Cannot chunk empty text");
  }

  std::vector<std::string> chunks;
  std::string paragraph;

  auto flush = [&]() {
    std::string trimmed = trim(paragraph);
    if (!trimmed.empty()) {
      chunks.push_back(std::move(trimmed));
    }
    paragraph.clear();
  };

  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (is_blank(line)) {
      flush();
      continue;
    }
    if (!paragraph.empty()) {
      paragraph += '\n';
    }
    paragraph += line;
  }
  flush();

  std::clog << "[Chunker] Split into " << chunks.size() << " paragraphs" << std::endl;
  return chunks;
}

}  // namespace docsearch_core
