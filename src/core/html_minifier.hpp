#ifndef HTML_MINIFIER_HPP
#define HTML_MINIFIER_HPP

#include <string>
#include <vector>

struct HtmlMinifierOptions {
  // Elements after which "> <" keeps its space. "?" stands for the "?>"
  // closing marker of embedded code.
  std::vector<std::string> inline_tags = default_inline_tags();

  static std::vector<std::string> default_inline_tags();
};

// Whitespace and comment stripping for HTML templates with embedded PHP.
// minify() runs the stages below in declaration order; each one only ever
// sees the output of the previous one.
class HtmlMinifier {
public:
  using Options = HtmlMinifierOptions;

  static std::string minify(const std::string &html,
                            const Options &opts = Options());

  // Inside <script>: drops `// ... <?php ... ?>` line tails.
  static std::string strip_commented_code_in_scripts(const std::string &html);

  // Inside <script>: drops `//` comments that do not look like part of a
  // string, URL or regexp, and leaves CDATA markers alone.
  static std::string strip_line_comments_in_scripts(const std::string &html);

  // Outside <textarea>, <pre> and <script> bodies: any whitespace run that
  // is longer than a single space becomes one space.
  static std::string collapse_whitespace(const std::string &html);

  static std::string
  remove_space_between_tags(const std::string &html,
                            const std::vector<std::string> &inline_tags);

  // `<?php ... ?>` blocks that are not output or conditional statements
  // keep exactly one space after their closing marker.
  static std::string collapse_space_after_code(const std::string &html);

  static std::string remove_space_before_closing_tags(const std::string &html);

private:
  static bool is_whitespace(char c);
  static size_t skip_whitespace(const std::string &html, size_t pos);
  static size_t line_end(const std::string &html, size_t pos);
  static bool ends_with_any(const std::string &html, size_t pos,
                            const std::vector<std::string> &suffixes);
};

#endif // HTML_MINIFIER_HPP
