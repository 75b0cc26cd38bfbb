#include "LinkKeeper/refs/document_corpus.hpp"

namespace LinkKeeper::refs {

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  usize start = 0;
  while (true) {
    auto newline = text.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
  std::string result;
  usize total = 0;
  for (const auto& line : lines) {
    total += line.size() + 1;
  }
  result.reserve(total);
  for (usize i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result += '\n';
    }
    result += lines[i];
  }
  return result;
}

} // namespace LinkKeeper::refs
