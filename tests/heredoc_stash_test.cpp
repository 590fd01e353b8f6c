#include "core/heredoc_stash.hpp"
#include <gtest/gtest.h>

namespace {

TEST(HeredocStashTest, Placeholder) {
  EXPECT_EQ("__MINIFIED_HEREDOC__0", HeredocStash::placeholder(0));
  EXPECT_EQ("__MINIFIED_HEREDOC__12", HeredocStash::placeholder(12));
}

TEST(HeredocStashTest, StashSingleBlock) {
  std::vector<std::string> blocks;
  std::string result =
      HeredocStash::stash("a <<<EOT\n  x  y\nEOT;\nb", blocks);

  EXPECT_EQ("a __MINIFIED_HEREDOC__0\nb", result);
  ASSERT_EQ(1u, blocks.size());
  EXPECT_EQ("<<<EOT\n  x  y\nEOT;", blocks[0]);
}

TEST(HeredocStashTest, ClosingIdentifierIsCaseInsensitive) {
  std::vector<std::string> blocks;
  std::string result = HeredocStash::stash("<<<html\n<p>\nHTML;", blocks);

  EXPECT_EQ("__MINIFIED_HEREDOC__0", result);
  ASSERT_EQ(1u, blocks.size());
  EXPECT_EQ("<<<html\n<p>\nHTML;", blocks[0]);
}

TEST(HeredocStashTest, WhitespaceBeforeTerminator) {
  std::vector<std::string> blocks;
  std::string result = HeredocStash::stash("<<<EOT\nx\nEOT \n;", blocks);

  EXPECT_EQ("__MINIFIED_HEREDOC__0", result);
  ASSERT_EQ(1u, blocks.size());
  EXPECT_EQ("<<<EOT\nx\nEOT \n;", blocks[0]);
}

TEST(HeredocStashTest, BlocksAreNumberedInDiscoveryOrder) {
  std::vector<std::string> blocks;
  std::string result =
      HeredocStash::stash("<<<A\n1\nA;-<<<B\n2\nB;", blocks);

  EXPECT_EQ("__MINIFIED_HEREDOC__0-__MINIFIED_HEREDOC__1", result);
  ASSERT_EQ(2u, blocks.size());
  EXPECT_EQ("<<<A\n1\nA;", blocks[0]);
  EXPECT_EQ("<<<B\n2\nB;", blocks[1]);
}

TEST(HeredocStashTest, FirstClosingIdentifierEndsTheBlock) {
  std::vector<std::string> blocks;
  std::string result =
      HeredocStash::stash("<<<EOT\na\nEOT;\nmid\nEOT;", blocks);

  EXPECT_EQ("__MINIFIED_HEREDOC__0\nmid\nEOT;", result);
  ASSERT_EQ(1u, blocks.size());
  EXPECT_EQ("<<<EOT\na\nEOT;", blocks[0]);
}

TEST(HeredocStashTest, UnclosedBlockIsLeftInPlace) {
  std::vector<std::string> blocks;
  std::string content = "x <<<EOT\nnever   closed";

  EXPECT_EQ(content, HeredocStash::stash(content, blocks));
  EXPECT_TRUE(blocks.empty());
}

TEST(HeredocStashTest, IntroducerWithoutIdentifierIsIgnored) {
  std::vector<std::string> blocks;
  std::string content = "if (a <<< 2) { b; }";

  EXPECT_EQ(content, HeredocStash::stash(content, blocks));
  EXPECT_TRUE(blocks.empty());
}

TEST(HeredocStashTest, RestoreGivesBackOriginalText) {
  std::string content =
      "<p>  a</p>\n<?php $x = <<<EOT\n  raw   text\nEOT;\n$y = <<<END\n\n"
      "END;\n?>";
  std::vector<std::string> blocks;
  std::string stashed = HeredocStash::stash(content, blocks);

  EXPECT_EQ(2u, blocks.size());
  EXPECT_EQ(std::string::npos, stashed.find("raw"));
  EXPECT_EQ(content, HeredocStash::restore(stashed, blocks));
}

TEST(HeredocStashTest, RestoreLeavesUnknownIndexUntouched) {
  std::vector<std::string> blocks = {"<<<A\nA;"};

  EXPECT_EQ("__MINIFIED_HEREDOC__5",
            HeredocStash::restore("__MINIFIED_HEREDOC__5", blocks));
  EXPECT_EQ("x <<<A\nA; __MINIFIED_HEREDOC__",
            HeredocStash::restore("x __MINIFIED_HEREDOC__0 __MINIFIED_HEREDOC__",
                                  blocks));
}

TEST(HeredocStashTest, RestoreWithoutBlocksIsIdentity) {
  EXPECT_EQ("__MINIFIED_HEREDOC__0",
            HeredocStash::restore("__MINIFIED_HEREDOC__0", {}));
}

} // namespace
