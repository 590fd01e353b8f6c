#include "heredoc_stash.hpp"
#include <cctype>

static bool is_ascii_letter(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static bool is_whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

std::string HeredocStash::placeholder(size_t index) {
  return std::string(PLACEHOLDER_MARKER) + std::to_string(index);
}

bool HeredocStash::equals_ignore_case(const std::string &content, size_t pos,
                                      const std::string &word) {
  if (pos + word.length() > content.length()) {
    return false;
  }
  for (size_t k = 0; k < word.length(); k++) {
    if (std::tolower(static_cast<unsigned char>(content[pos + k])) !=
        std::tolower(static_cast<unsigned char>(word[k]))) {
      return false;
    }
  }
  return true;
}

size_t HeredocStash::find_block_end(const std::string &content, size_t from,
                                    const std::string &identifier) {
  for (size_t p = from; p + identifier.length() <= content.length(); p++) {
    if (!equals_ignore_case(content, p, identifier)) {
      continue;
    }

    size_t q = p + identifier.length();
    while (q < content.length() && is_whitespace(content[q])) {
      q++;
    }
    if (q < content.length() && content[q] == ';') {
      return q + 1;
    }
  }
  return std::string::npos;
}

std::string HeredocStash::stash(const std::string &content,
                                std::vector<std::string> &blocks) {
  std::string result;
  result.reserve(content.length());

  size_t copied = 0;
  size_t i = content.find("<<<");

  while (i != std::string::npos) {
    size_t id_start = i + 3;
    size_t id_end = id_start;
    while (id_end < content.length() && is_ascii_letter(content[id_end])) {
      id_end++;
    }

    // Longest identifier first, then shorter prefixes of it.
    size_t block_end = std::string::npos;
    for (size_t len = id_end - id_start; len > 0; len--) {
      block_end = find_block_end(content, id_start + len,
                                 content.substr(id_start, len));
      if (block_end != std::string::npos) {
        break;
      }
    }

    if (block_end == std::string::npos) {
      i = content.find("<<<", i + 1);
      continue;
    }

    result.append(content, copied, i - copied);
    blocks.push_back(content.substr(i, block_end - i));
    result += placeholder(blocks.size() - 1);

    copied = block_end;
    i = content.find("<<<", block_end);
  }

  result.append(content, copied, std::string::npos);
  return result;
}

std::string HeredocStash::restore(const std::string &content,
                                  const std::vector<std::string> &blocks) {
  static const std::string marker = PLACEHOLDER_MARKER;

  if (blocks.empty()) {
    return content;
  }

  std::string result;
  result.reserve(content.length());

  size_t copied = 0;
  size_t i = content.find(marker);

  while (i != std::string::npos) {
    size_t digits_start = i + marker.length();
    size_t digits_end = digits_start;
    while (digits_end < content.length() &&
           std::isdigit(static_cast<unsigned char>(content[digits_end]))) {
      digits_end++;
    }

    size_t digit_count = digits_end - digits_start;
    if (digit_count == 0 || digit_count > 9) {
      i = content.find(marker, digits_start);
      continue;
    }

    size_t index = std::stoul(content.substr(digits_start, digit_count));
    if (index >= blocks.size()) {
      i = content.find(marker, digits_end);
      continue;
    }

    result.append(content, copied, i - copied);
    result += blocks[index];

    copied = digits_end;
    i = content.find(marker, digits_end);
  }

  result.append(content, copied, std::string::npos);
  return result;
}
