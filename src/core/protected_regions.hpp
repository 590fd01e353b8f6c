#ifndef PROTECTED_REGIONS_HPP
#define PROTECTED_REGIONS_HPP

#include <string>
#include <vector>

// Answers "is this offset inside an unclosed body of one of these elements"
// by looking at the nearest tag of the set at or after the offset: a closing
// tag means the offset is inside, an opening tag or end of input means it is
// not.
class ProtectedRegions {
public:
  ProtectedRegions(const std::string &content,
                   const std::vector<std::string> &tags,
                   bool case_insensitive);

  bool inside(size_t pos) const;

  // Offset of the nearest tag of the set at or after pos, npos if none.
  size_t next_tag(size_t pos) const;

private:
  struct TagMark {
    size_t pos;
    bool closing;
  };

  std::vector<TagMark> marks;

  std::vector<TagMark>::const_iterator find_mark(size_t pos) const;

  static bool is_word_char(char c);
  static bool matches_at(const std::string &content, size_t pos,
                         const std::string &name, bool case_insensitive);
};

#endif // PROTECTED_REGIONS_HPP
