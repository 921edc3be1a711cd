#include "docsearch_core/extractors/plaintext_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace docsearch_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    std::string extension = file_path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".txt";
}

std::string PlainTextExtractor::extract_text(const std::filesystem::path& file_path) const {
    std::string content = get_string_content(file_path);
    ensure_not_empty(content, file_path);

    std::string text = normalize_paragraph_breaks(content);
    std::clog << "[Extractor] Read " << text.size() << " characters from "
              << file_path.string() << std::endl;
    return text;
}

} // namespace docsearch_core
