#ifndef CODE_COMMENT_TRANSFORMER_HPP
#define CODE_COMMENT_TRANSFORMER_HPP

#include <string>
#include <variant>
#include <vector>

enum class TransformFailureKind { Unparseable, NestingTooDeep, Disabled };

struct TransformSuccess {
  std::string content;
  // Heredoc blocks left in `content` as HeredocStash placeholders.
  std::vector<std::string> delayed_blocks;
};

struct TransformFailure {
  TransformFailureKind kind;
  std::string reason;
};

using TransformResult = std::variant<TransformSuccess, TransformFailure>;

const char *to_string(TransformFailureKind kind);

// Removes single-line comments from the embedded code of a template, or
// reports why it could not.
class CodeCommentTransformer {
public:
  virtual ~CodeCommentTransformer() = default;

  virtual TransformResult transform(const std::string &content) const = 0;
};

// Lexes <?php / <?= regions: strings, block comments and heredocs are kept
// as they are, `//` and `#` comments are dropped, heredocs are delayed.
class PhpCommentStripper : public CodeCommentTransformer {
public:
  static constexpr size_t DEFAULT_MAX_NESTING_LEVEL = 3000;

  explicit PhpCommentStripper(
      size_t max_nesting_level = DEFAULT_MAX_NESTING_LEVEL);

  TransformResult transform(const std::string &content) const override;

private:
  size_t max_nesting_level;
};

class DisabledCommentTransformer : public CodeCommentTransformer {
public:
  TransformResult transform(const std::string &content) const override;
};

#endif // CODE_COMMENT_TRANSFORMER_HPP
