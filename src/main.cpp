#include "core/template_minifier.hpp"
#include "utils/config.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "tmplmin - HTML/PHP template minifier\n\n";
  std::cout << "Commands:\n";
  std::cout << "  tmplmin minify <file>...  Minify templates into the cache\n";
  std::cout << "  tmplmin get <file>...     Print cached copy, minify if missing\n";
  std::cout << "  tmplmin path <file>...    Print where the cached copy lives\n";
  std::cout << "  tmplmin --help            Show this help\n\n";
  std::cout << "Settings are read from ./tmplmin.yaml when present.\n";
}

static MinifierConfig load_config(const fs::path &config_path) {
  if (!fs::exists(config_path)) {
    log_warning(config_path.filename().string() +
                " not found, using defaults");
    return MinifierConfig();
  }

  MinifierConfig config = MinifierConfig::load(config_path);
  for (const auto &key : config.unknown_keys) {
    log_warning("Unknown config key '" + key + "'");
  }
  return config;
}

static TemplateMinifier make_minifier(const MinifierConfig &config,
                                      const fs::path &project_root) {
  fs::path root = fs::path(config.root_dir).is_absolute()
                      ? fs::path(config.root_dir)
                      : project_root / config.root_dir;

  std::unique_ptr<CodeCommentTransformer> transformer;
  if (config.php_comments) {
    transformer =
        std::make_unique<PhpCommentStripper>(config.max_nesting_level);
  } else {
    transformer = std::make_unique<DisabledCommentTransformer>();
  }

  HtmlMinifierOptions options;
  if (config.inline_tags) {
    options.inline_tags = *config.inline_tags;
  }

  return TemplateMinifier(MinifiedCacheStore(root, config.cache_dir),
                          std::move(transformer), options);
}

static uintmax_t size_or_zero(const fs::path &path) {
  std::error_code ec;
  uintmax_t size = fs::file_size(path, ec);
  return ec ? 0 : size;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  fs::path project_root = fs::current_path();

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  if (command != "minify" && command != "get" && command != "path") {
    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
  }

  std::vector<fs::path> files(argv + 2, argv + argc);
  if (files.empty()) {
    std::cerr << "No template files given" << std::endl;
    print_usage();
    return 1;
  }

  try {
    MinifierConfig config = load_config(project_root / "tmplmin.yaml");
    TemplateMinifier minifier = make_minifier(config, project_root);

    int error_count = 0;

    for (const auto &file : files) {
      try {
        if (command == "path") {
          std::cout << minifier.get_path_to_minified(
                           MinifiedCacheStore::resolve_real_path(file))
                           .string()
                    << "\n";
          continue;
        }

        if (command == "get") {
          std::cout << minifier.get_minified(file).string() << "\n";
          continue;
        }

        auto start = std::chrono::high_resolution_clock::now();
        fs::path source = MinifiedCacheStore::resolve_real_path(file);
        minifier.minify(source);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start);

        log_file_result(file.string(),
                        "(" + std::to_string(size_or_zero(source)) + " → " +
                            std::to_string(size_or_zero(
                                minifier.get_path_to_minified(source))) +
                            " bytes)",
                        elapsed);
      } catch (const std::exception &e) {
        error_count++;
        log_error(file.string() + ": " + e.what());
      }
    }

    if (command == "minify" && error_count == 0) {
      log_success("Minified " + std::to_string(files.size()) + " template(s)");
    }
    return error_count > 0 ? 1 : 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
