#include "template_minifier.hpp"
#include "heredoc_stash.hpp"
#include "utils/log.hpp"
#include <utility>
#include <variant>
#include <vector>

static std::string rtrim(const std::string &str) {
  static const std::string trailing(" \t\n\r\v\0", 6);
  size_t end = str.find_last_not_of(trailing);
  return end == std::string::npos ? std::string() : str.substr(0, end + 1);
}

TemplateMinifier::TemplateMinifier(
    MinifiedCacheStore cache_store,
    std::unique_ptr<CodeCommentTransformer> transformer,
    HtmlMinifierOptions opts)
    : store(std::move(cache_store)),
      comment_transformer(std::move(transformer)), options(std::move(opts)) {
  if (!comment_transformer) {
    comment_transformer = std::make_unique<DisabledCommentTransformer>();
  }
}

fs::path TemplateMinifier::get_minified(const fs::path &file) {
  fs::path real_path = MinifiedCacheStore::resolve_real_path(file);
  if (!store.exists(store.relative_path(real_path))) {
    minify(real_path);
  }
  return get_path_to_minified(real_path);
}

fs::path TemplateMinifier::get_path_to_minified(const fs::path &file) const {
  return store.absolute_path(store.relative_path(file));
}

void TemplateMinifier::minify(const fs::path &file) {
  std::string content = store.read_source(file).value_or("");
  std::string minified = minify_content(content);

  if (!store.exists()) {
    store.create();
  }
  store.write_file(store.relative_path(file), minified);
}

std::string
TemplateMinifier::minify_content(const std::string &content) const {
  std::string working = content;
  std::vector<std::string> heredocs;

  TransformResult result = comment_transformer->transform(content);

  if (auto *success = std::get_if<TransformSuccess>(&result)) {
    working = std::move(success->content);
    heredocs = std::move(success->delayed_blocks);
  } else {
    const auto &failure = std::get<TransformFailure>(result);
    if (failure.kind != TransformFailureKind::Disabled) {
      log_warning("PHP comments kept (" + std::string(to_string(failure.kind)) +
                  ": " + failure.reason + ")");
    }

    // The whitespace stages know nothing about heredocs.
    working = HeredocStash::stash(working, heredocs);
  }

  working = HtmlMinifier::minify(working, options);
  working = HeredocStash::restore(working, heredocs);

  return rtrim(working);
}
