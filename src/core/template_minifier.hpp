#ifndef TEMPLATE_MINIFIER_HPP
#define TEMPLATE_MINIFIER_HPP

#include "code_comment_transformer.hpp"
#include "html_minifier.hpp"
#include "minified_cache_store.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

class TemplateMinifier {
private:
  MinifiedCacheStore store;
  std::unique_ptr<CodeCommentTransformer> comment_transformer;
  HtmlMinifierOptions options;

public:
  TemplateMinifier(MinifiedCacheStore cache_store,
                   std::unique_ptr<CodeCommentTransformer> transformer,
                   HtmlMinifierOptions opts = HtmlMinifierOptions());

  // Path of the minified copy, generating it first if it is not cached yet.
  fs::path get_minified(const fs::path &file);

  fs::path get_path_to_minified(const fs::path &file) const;

  // Regenerates the minified copy of `file`, overwriting any cached one.
  void minify(const fs::path &file);

  std::string minify_content(const std::string &content) const;

  const MinifiedCacheStore &get_store() const { return store; }
};

#endif // TEMPLATE_MINIFIER_HPP
