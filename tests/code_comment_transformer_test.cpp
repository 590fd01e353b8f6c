#include "core/code_comment_transformer.hpp"
#include <gtest/gtest.h>

namespace {

class PhpCommentStripperTest : public ::testing::Test {
protected:
  TransformSuccess ExpectSuccess(const std::string &input) {
    TransformResult result = stripper_.transform(input);
    EXPECT_TRUE(std::holds_alternative<TransformSuccess>(result)) << input;
    if (auto *success = std::get_if<TransformSuccess>(&result)) {
      return *success;
    }
    return TransformSuccess();
  }

  void ValidateExpected(const std::string &input, const std::string &expected) {
    TransformSuccess success = ExpectSuccess(input);
    EXPECT_EQ(expected, success.content);
    EXPECT_TRUE(success.delayed_blocks.empty());
  }

  void ValidateNoChanges(const std::string &input) {
    ValidateExpected(input, input);
  }

  void ValidateFailure(const PhpCommentStripper &stripper,
                       const std::string &input, TransformFailureKind kind) {
    TransformResult result = stripper.transform(input);
    ASSERT_TRUE(std::holds_alternative<TransformFailure>(result)) << input;
    EXPECT_EQ(kind, std::get<TransformFailure>(result).kind);
    EXPECT_FALSE(std::get<TransformFailure>(result).reason.empty());
  }

  PhpCommentStripper stripper_;
};

TEST_F(PhpCommentStripperTest, LineCommentsRemoved) {
  ValidateExpected("<?php $a = 1; // one\n# two\n$b = 2; ?>",
                   "<?php $a = 1; \n\n$b = 2; ?>");
}

TEST_F(PhpCommentStripperTest, CommentEndsAtCloseMarker) {
  ValidateExpected("<?php foo(); // bar ?><p>x</p>",
                   "<?php foo(); ?><p>x</p>");
}

TEST_F(PhpCommentStripperTest, ShortEchoTag) {
  ValidateExpected("<?= $a // c\n?>", "<?= $a \n?>");
}

TEST_F(PhpCommentStripperTest, CommentAtEndOfFile) {
  ValidateExpected("<?php\n$a = 1; // end", "<?php\n$a = 1; ");
}

TEST_F(PhpCommentStripperTest, AttributesKept) {
  ValidateNoChanges("<?php #[Pure]\nfunction f() {} ?>");
}

TEST_F(PhpCommentStripperTest, StringsAndBlockCommentsKept) {
  ValidateNoChanges("<?php $u = 'http://x'; $s = \"# not\"; ?>");
  ValidateNoChanges("<?php $s = 'it\\'s // here'; ?>");
  ValidateNoChanges("<?php /* keep // this */ $a = 1; ?>");
}

TEST_F(PhpCommentStripperTest, MarkupOutsideCodeUntouched) {
  ValidateNoChanges("<p>// not code # either</p>");
  ValidateNoChanges("<?xml version=\"1.0\"?>\n<p># x</p>");
}

TEST_F(PhpCommentStripperTest, BracketsMaySpanCodeRegions) {
  ValidateNoChanges("<?php if ($a) { ?><p>x</p><?php } ?>");
}

TEST_F(PhpCommentStripperTest, HeredocDelayed) {
  TransformSuccess success =
      ExpectSuccess("<?php $a = <<<EOT\n// not a comment\nEOT;\n?>");

  EXPECT_EQ("<?php $a = __MINIFIED_HEREDOC__0;\n?>", success.content);
  ASSERT_EQ(1u, success.delayed_blocks.size());
  EXPECT_EQ("<<<EOT\n// not a comment\nEOT", success.delayed_blocks[0]);
}

TEST_F(PhpCommentStripperTest, NowdocAndIndentedCloserDelayed) {
  TransformSuccess success = ExpectSuccess(
      "<?php $a = <<<'EOT'\nx\nEOT;\n$b = <<<\"END\"\n  y\n  END;\n?>");

  EXPECT_EQ("<?php $a = __MINIFIED_HEREDOC__0;\n"
            "$b = __MINIFIED_HEREDOC__1;\n?>",
            success.content);
  ASSERT_EQ(2u, success.delayed_blocks.size());
  EXPECT_EQ("<<<'EOT'\nx\nEOT", success.delayed_blocks[0]);
  EXPECT_EQ("<<<\"END\"\n  y\n  END", success.delayed_blocks[1]);
}

TEST_F(PhpCommentStripperTest, UnterminatedStringFails) {
  ValidateFailure(stripper_, "<?php $a = 'oops; ?>\n<p>x</p>",
                  TransformFailureKind::Unparseable);
}

TEST_F(PhpCommentStripperTest, UnterminatedHeredocFails) {
  ValidateFailure(stripper_, "<?php $a = <<<EOT\nnever closed\n",
                  TransformFailureKind::Unparseable);
}

TEST_F(PhpCommentStripperTest, UnbalancedBracketsFail) {
  ValidateFailure(stripper_, "<?php } ?>", TransformFailureKind::Unparseable);
  ValidateFailure(stripper_, "<?php if ($a) { ?>",
                  TransformFailureKind::Unparseable);
}

TEST_F(PhpCommentStripperTest, NestingTooDeepFails) {
  PhpCommentStripper shallow(3);
  ValidateFailure(shallow, "<?php f(g(h(i()))); ?>",
                  TransformFailureKind::NestingTooDeep);
}

TEST(DisabledCommentTransformerTest, AlwaysFails) {
  DisabledCommentTransformer transformer;
  TransformResult result = transformer.transform("<?php // x ?>");

  ASSERT_TRUE(std::holds_alternative<TransformFailure>(result));
  EXPECT_EQ(TransformFailureKind::Disabled,
            std::get<TransformFailure>(result).kind);
}

TEST(TransformFailureKindTest, ToString) {
  EXPECT_STREQ("unparseable", to_string(TransformFailureKind::Unparseable));
  EXPECT_STREQ("nesting too deep",
               to_string(TransformFailureKind::NestingTooDeep));
}

} // namespace
