#include "code_comment_transformer.hpp"
#include "heredoc_stash.hpp"
#include <cctype>
#include <stdexcept>

const char *to_string(TransformFailureKind kind) {
  switch (kind) {
  case TransformFailureKind::Unparseable:
    return "unparseable";
  case TransformFailureKind::NestingTooDeep:
    return "nesting too deep";
  case TransformFailureKind::Disabled:
    return "disabled";
  }
  return "unknown";
}

namespace {

class PhpLexError : public std::runtime_error {
public:
  PhpLexError(TransformFailureKind kind, const std::string &message)
      : std::runtime_error(message), kind(kind) {}

  TransformFailureKind kind;
};

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
  return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool is_whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

class PhpLexer {
public:
  PhpLexer(const std::string &src, size_t max_depth)
      : src(src), max_depth(max_depth) {}

  TransformSuccess run() {
    out.reserve(src.length());

    while (pos < src.length()) {
      size_t tag_len = 0;
      size_t open = find_open_tag(pos, tag_len);
      if (open == std::string::npos) {
        out.append(src, pos, std::string::npos);
        pos = src.length();
        break;
      }

      out.append(src, pos, open + tag_len - pos);
      pos = open + tag_len;
      lex_code();
    }

    if (depth != 0) {
      fail(TransformFailureKind::Unparseable,
           std::to_string(depth) + " unclosed bracket(s) at end of file");
    }

    return TransformSuccess{std::move(out), std::move(delayed)};
  }

private:
  const std::string &src;
  size_t max_depth;
  size_t pos = 0;
  size_t depth = 0;
  std::string out;
  std::vector<std::string> delayed;

  [[noreturn]] void fail(TransformFailureKind kind,
                         const std::string &message) const {
    throw PhpLexError(kind, message + " (line " + std::to_string(line_at(pos)) +
                                ")");
  }

  size_t line_at(size_t offset) const {
    size_t line = 1;
    for (size_t i = 0; i < offset && i < src.length(); i++) {
      if (src[i] == '\n') {
        line++;
      }
    }
    return line;
  }

  bool at(size_t offset, const char *text) const {
    return src.compare(offset, std::char_traits<char>::length(text), text) ==
           0;
  }

  // <?= or <?php followed by whitespace / end of input.
  size_t find_open_tag(size_t from, size_t &tag_len) const {
    size_t i = src.find("<?", from);

    while (i != std::string::npos) {
      if (i + 2 < src.length() && src[i + 2] == '=') {
        tag_len = 3;
        return i;
      }

      if (i + 5 <= src.length() &&
          std::tolower(static_cast<unsigned char>(src[i + 2])) == 'p' &&
          std::tolower(static_cast<unsigned char>(src[i + 3])) == 'h' &&
          std::tolower(static_cast<unsigned char>(src[i + 4])) == 'p' &&
          (i + 5 == src.length() || is_whitespace(src[i + 5]))) {
        tag_len = 5;
        return i;
      }

      i = src.find("<?", i + 1);
    }

    return std::string::npos;
  }

  void lex_code() {
    while (pos < src.length()) {
      char c = src[pos];
      char next = (pos + 1 < src.length()) ? src[pos + 1] : '\0';

      if (c == '?' && next == '>') {
        out += "?>";
        pos += 2;
        return;
      }

      if (c == '\'' || c == '"' || c == '`') {
        copy_quoted(c);
        continue;
      }

      if (c == '/' && next == '*') {
        copy_block_comment();
        continue;
      }

      if ((c == '/' && next == '/') || (c == '#' && next != '[')) {
        skip_line_comment();
        continue;
      }

      if (at(pos, "<<<")) {
        delay_heredoc();
        continue;
      }

      if (c == '(' || c == '[' || c == '{') {
        if (++depth > max_depth) {
          fail(TransformFailureKind::NestingTooDeep,
               "bracket nesting exceeds " + std::to_string(max_depth));
        }
      } else if (c == ')' || c == ']' || c == '}') {
        if (depth == 0) {
          fail(TransformFailureKind::Unparseable,
               std::string("unexpected '") + c + "'");
        }
        depth--;
      }

      out += c;
      pos++;
    }
  }

  void copy_quoted(char quote) {
    size_t start = pos;
    pos++;

    while (pos < src.length()) {
      char c = src[pos];
      if (c == '\\') {
        pos += 2;
        continue;
      }
      if (c == quote) {
        pos++;
        out.append(src, start, pos - start);
        return;
      }
      pos++;
    }

    pos = start;
    fail(TransformFailureKind::Unparseable, "unterminated string");
  }

  void copy_block_comment() {
    size_t end = src.find("*/", pos + 2);
    if (end == std::string::npos) {
      fail(TransformFailureKind::Unparseable, "unterminated comment");
    }

    out.append(src, pos, end + 2 - pos);
    pos = end + 2;
  }

  // A line comment ends at the line break or at ?>, both of which are kept.
  void skip_line_comment() {
    while (pos < src.length() && src[pos] != '\n' && src[pos] != '\r' &&
           !at(pos, "?>")) {
      pos++;
    }
  }

  void delay_heredoc() {
    size_t start = pos;
    size_t p = pos + 3;

    while (p < src.length() && (src[p] == ' ' || src[p] == '\t')) {
      p++;
    }

    char quote = '\0';
    if (p < src.length() && (src[p] == '\'' || src[p] == '"')) {
      quote = src[p];
      p++;
    }

    if (p >= src.length() || !is_ident_start(src[p])) {
      fail(TransformFailureKind::Unparseable, "invalid heredoc label");
    }

    size_t id_start = p;
    while (p < src.length() && is_ident_char(src[p])) {
      p++;
    }
    std::string identifier = src.substr(id_start, p - id_start);

    if (quote != '\0') {
      if (p >= src.length() || src[p] != quote) {
        fail(TransformFailureKind::Unparseable,
             "unterminated quote around heredoc label " + identifier);
      }
      p++;
    }

    if (p < src.length() && src[p] == '\r') {
      p++;
    }
    if (p >= src.length() || src[p] != '\n') {
      fail(TransformFailureKind::Unparseable,
           "heredoc label " + identifier + " must end the line");
    }

    // The closing label starts a line, optionally indented.
    size_t line = p + 1;
    while (line <= src.length()) {
      size_t q = line;
      while (q < src.length() && (src[q] == ' ' || src[q] == '\t')) {
        q++;
      }

      size_t end = q + identifier.length();
      if (at(q, identifier.c_str()) &&
          (end >= src.length() || !is_ident_char(src[end]))) {
        delayed.push_back(src.substr(start, end - start));
        out += HeredocStash::placeholder(delayed.size() - 1);
        pos = end;
        return;
      }

      size_t newline = src.find('\n', line);
      if (newline == std::string::npos) {
        break;
      }
      line = newline + 1;
    }

    fail(TransformFailureKind::Unparseable,
         "unterminated heredoc " + identifier);
  }
};

} // namespace

PhpCommentStripper::PhpCommentStripper(size_t max_nesting_level)
    : max_nesting_level(max_nesting_level) {}

TransformResult PhpCommentStripper::transform(const std::string &content) const {
  try {
    PhpLexer lexer(content, max_nesting_level);
    return lexer.run();
  } catch (const PhpLexError &e) {
    return TransformFailure{e.kind, e.what()};
  }
}

TransformResult
DisabledCommentTransformer::transform(const std::string &content) const {
  (void)content;
  return TransformFailure{TransformFailureKind::Disabled,
                          "PHP comment stripping is disabled"};
}
