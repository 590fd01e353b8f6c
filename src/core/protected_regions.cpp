#include "protected_regions.hpp"
#include <algorithm>
#include <cctype>

bool ProtectedRegions::is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool ProtectedRegions::matches_at(const std::string &content, size_t pos,
                                  const std::string &name,
                                  bool case_insensitive) {
  if (pos + name.length() > content.length()) {
    return false;
  }

  for (size_t k = 0; k < name.length(); k++) {
    char a = content[pos + k];
    char b = name[k];
    if (case_insensitive) {
      a = std::tolower(static_cast<unsigned char>(a));
      b = std::tolower(static_cast<unsigned char>(b));
    }
    if (a != b) {
      return false;
    }
  }

  size_t after = pos + name.length();
  return after >= content.length() || !is_word_char(content[after]);
}

ProtectedRegions::ProtectedRegions(const std::string &content,
                                   const std::vector<std::string> &tags,
                                   bool case_insensitive) {
  size_t i = content.find('<');

  while (i != std::string::npos) {
    bool closing = (i + 1 < content.length() && content[i + 1] == '/');
    size_t name_pos = closing ? i + 2 : i + 1;

    for (const auto &tag : tags) {
      if (matches_at(content, name_pos, tag, case_insensitive)) {
        marks.push_back({i, closing});
        break;
      }
    }

    i = content.find('<', i + 1);
  }
}

std::vector<ProtectedRegions::TagMark>::const_iterator
ProtectedRegions::find_mark(size_t pos) const {
  return std::lower_bound(
      marks.begin(), marks.end(), pos,
      [](const TagMark &mark, size_t value) { return mark.pos < value; });
}

bool ProtectedRegions::inside(size_t pos) const {
  auto it = find_mark(pos);
  if (it == marks.end()) {
    return false;
  }
  return it->closing;
}

size_t ProtectedRegions::next_tag(size_t pos) const {
  auto it = find_mark(pos);
  return it == marks.end() ? std::string::npos : it->pos;
}
