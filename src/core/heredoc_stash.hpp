#ifndef HEREDOC_STASH_HPP
#define HEREDOC_STASH_HPP

#include <string>
#include <vector>

// Swaps heredoc blocks (<<<ID ... ID;) for placeholder tokens so the
// whitespace stages never see their contents, and splices them back later.
class HeredocStash {
public:
  static constexpr const char *PLACEHOLDER_MARKER = "__MINIFIED_HEREDOC__";

  static std::string placeholder(size_t index);

  // Replaces every block with placeholder(n), n being its position in
  // `blocks` (appended in discovery order).
  static std::string stash(const std::string &content,
                           std::vector<std::string> &blocks);

  // Tokens whose index is out of range are left untouched.
  static std::string restore(const std::string &content,
                             const std::vector<std::string> &blocks);

private:
  static size_t find_block_end(const std::string &content, size_t from,
                               const std::string &identifier);
  static bool equals_ignore_case(const std::string &content, size_t pos,
                                 const std::string &word);
};

#endif // HEREDOC_STASH_HPP
