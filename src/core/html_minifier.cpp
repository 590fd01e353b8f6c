#include "html_minifier.hpp"
#include "protected_regions.hpp"
#include <algorithm>

namespace {

const std::vector<std::string> SCRIPT_TAG = {"script"};
const std::vector<std::string> WHITESPACE_SENSITIVE_TAGS = {"textarea", "pre",
                                                            "script"};
const std::vector<std::string> CODE_STATEMENTS_KEEPING_SPACE = {
    "echo", "print", "if", "elseif", "else"};

// End of a comment cut starting at `pos`: the end of the line or the closing
// script tag, whichever comes first. npos when `pos` is not in a script body.
size_t script_comment_end(const ProtectedRegions &scripts, size_t pos,
                          size_t eol) {
  if (!scripts.inside(pos)) {
    return std::string::npos;
  }
  return std::min(eol, scripts.next_tag(pos));
}

} // namespace

std::vector<std::string> HtmlMinifierOptions::default_inline_tags() {
  return {"b",     "big",     "i",    "small",  "tt",       "abbr",
          "acronym", "cite",  "code", "dfn",    "em",       "kbd",
          "strong", "samp",   "var",  "a",      "bdo",      "br",
          "img",   "map",     "object", "q",    "span",     "sub",
          "sup",   "button",  "input", "label", "select",   "textarea",
          "?"};
}

bool HtmlMinifier::is_whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

size_t HtmlMinifier::skip_whitespace(const std::string &html, size_t pos) {
  while (pos < html.length() && is_whitespace(html[pos])) {
    pos++;
  }
  return pos;
}

size_t HtmlMinifier::line_end(const std::string &html, size_t pos) {
  size_t end = html.find_first_of("\n\r", pos);
  return end == std::string::npos ? html.length() : end;
}

bool HtmlMinifier::ends_with_any(const std::string &html, size_t pos,
                                 const std::vector<std::string> &suffixes) {
  for (const auto &suffix : suffixes) {
    if (!suffix.empty() && suffix.length() <= pos &&
        html.compare(pos - suffix.length(), suffix.length(), suffix) == 0) {
      return true;
    }
  }
  return false;
}

std::string
HtmlMinifier::strip_commented_code_in_scripts(const std::string &html) {
  ProtectedRegions scripts(html, SCRIPT_TAG, false);
  std::string result;
  result.reserve(html.length());

  size_t copied = 0;
  size_t i = html.find("//");

  while (i != std::string::npos) {
    if (i > 0 && (html[i - 1] == ':' || html[i - 1] == '\\')) {
      i = html.find("//", i + 1);
      continue;
    }

    size_t eol = line_end(html, i);

    size_t open = std::string::npos;
    for (size_t p = i + 2; p < eol; p++) {
      if (html.compare(p, 5, "<?php") == 0 && p + 5 <= eol) {
        open = p + 5;
        break;
      }
      if (html.compare(p, 3, "<?=") == 0 && p + 3 <= eol) {
        open = p + 3;
        break;
      }
    }

    size_t min_end = std::string::npos;
    if (open != std::string::npos) {
      for (size_t p = open; p + 3 <= eol; p++) {
        if (is_whitespace(html[p]) && html.compare(p + 1, 2, "?>") == 0) {
          min_end = p + 3;
          break;
        }
      }
    }

    size_t end = std::string::npos;
    if (min_end != std::string::npos) {
      end = script_comment_end(scripts, i, eol);
      if (end != std::string::npos && end < min_end) {
        end = std::string::npos;
      }
    }

    if (end == std::string::npos) {
      i = html.find("//", i + 1);
      continue;
    }

    result.append(html, copied, i - copied);
    copied = end;
    i = html.find("//", end);
  }

  result.append(html, copied, std::string::npos);
  return result;
}

std::string
HtmlMinifier::strip_line_comments_in_scripts(const std::string &html) {
  ProtectedRegions scripts(html, SCRIPT_TAG, false);
  std::string result;
  result.reserve(html.length());

  size_t copied = 0;
  size_t i = html.find("//");

  while (i != std::string::npos) {
    char prev = (i > 0) ? html[i - 1] : '\0';
    bool looks_literal = prev == ':' || prev == '\\' || prev == '\'' ||
                         prev == '"' || prev == '/';

    size_t after = skip_whitespace(html, i + 2);
    bool cdata_marker = html.compare(after, 3, "<![") == 0 ||
                        html.compare(after, 3, "]]>") == 0;

    if (looks_literal || (i + 2 < html.length() && html[i + 2] == '/') ||
        cdata_marker) {
      i = html.find("//", i + 1);
      continue;
    }

    size_t end = script_comment_end(scripts, i, line_end(html, i));
    if (end == std::string::npos) {
      i = html.find("//", i + 1);
      continue;
    }

    result.append(html, copied, i - copied);
    copied = end;
    i = html.find("//", end);
  }

  result.append(html, copied, std::string::npos);
  return result;
}

std::string HtmlMinifier::collapse_whitespace(const std::string &html) {
  ProtectedRegions sensitive(html, WHITESPACE_SENSITIVE_TAGS, true);
  std::string result;
  result.reserve(html.length());

  size_t i = 0;
  while (i < html.length()) {
    if (!is_whitespace(html[i])) {
      result += html[i++];
      continue;
    }

    size_t run_end = skip_whitespace(html, i);
    bool collapsible = html[i] != ' ' || run_end - i >= 2;

    if (collapsible && !sensitive.inside(run_end)) {
      result += ' ';
    } else {
      result.append(html, i, run_end - i);
    }
    i = run_end;
  }

  return result;
}

std::string HtmlMinifier::remove_space_between_tags(
    const std::string &html, const std::vector<std::string> &inline_tags) {
  ProtectedRegions sensitive(html, WHITESPACE_SENSITIVE_TAGS, true);
  std::string result;
  result.reserve(html.length());

  size_t i = 0;
  while (i < html.length()) {
    if (html.compare(i, 3, "> <") == 0 &&
        !ends_with_any(html, i, inline_tags) && !sensitive.inside(i + 1)) {
      result += "><";
      i += 3;
    } else {
      result += html[i++];
    }
  }

  return result;
}

std::string HtmlMinifier::collapse_space_after_code(const std::string &html) {
  ProtectedRegions sensitive(html, WHITESPACE_SENSITIVE_TAGS, true);
  std::string result;
  result.reserve(html.length());

  size_t copied = 0;
  size_t i = html.find("<?php");

  while (i != std::string::npos) {
    size_t body = skip_whitespace(html, i + 5);
    if (body == i + 5) {
      i = html.find("<?php", i + 1);
      continue;
    }

    bool keeps_space = false;
    for (const auto &keyword : CODE_STATEMENTS_KEEPING_SPACE) {
      if (html.compare(body, keyword.length(), keyword) == 0) {
        keeps_space = true;
        break;
      }
    }

    size_t question = html.find('?', body);
    if (keeps_space || question == std::string::npos ||
        html.compare(question, 2, "?>") != 0) {
      i = html.find("<?php", i + 1);
      continue;
    }

    size_t close_end = question + 2;
    size_t space_end = skip_whitespace(html, close_end);
    if (space_end == close_end || sensitive.inside(close_end)) {
      i = html.find("<?php", i + 1);
      continue;
    }

    result.append(html, copied, close_end - copied);
    result += ' ';
    copied = space_end;
    i = html.find("<?php", space_end);
  }

  result.append(html, copied, std::string::npos);
  return result;
}

std::string
HtmlMinifier::remove_space_before_closing_tags(const std::string &html) {
  ProtectedRegions sensitive(html, WHITESPACE_SENSITIVE_TAGS, true);
  std::string result;
  result.reserve(html.length());

  size_t i = 0;
  while (i < html.length()) {
    if (!is_whitespace(html[i])) {
      result += html[i++];
      continue;
    }

    size_t run_end = skip_whitespace(html, i);

    if (html.compare(run_end, 2, "</") != 0 || sensitive.inside(run_end)) {
      result.append(html, i, run_end - i);
    } else if (i >= 3 && html.compare(i - 3, 3, "]]>") == 0) {
      // One whitespace character survives after a CDATA end marker.
      result += html[i];
    }
    i = run_end;
  }

  return result;
}

std::string HtmlMinifier::minify(const std::string &html, const Options &opts) {
  std::string result = strip_commented_code_in_scripts(html);
  result = strip_line_comments_in_scripts(result);
  result = collapse_whitespace(result);
  result = remove_space_between_tags(result, opts.inline_tags);
  result = collapse_space_after_code(result);
  result = remove_space_before_closing_tags(result);
  return result;
}
