#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct MinifierConfig {
  std::string root_dir = ".";
  std::string cache_dir = "var/view_preprocessed";

  bool php_comments = true;
  std::size_t max_nesting_level = 3000;

  // Unset means the built-in inline element list.
  std::optional<std::vector<std::string>> inline_tags;

  std::vector<std::string> unknown_keys;

  static MinifierConfig load(const fs::path &config_path) {
    if (!fs::exists(config_path)) {
      throw std::runtime_error("Config file not found: " +
                               config_path.string());
    }

    try {
      return parse(YAML::LoadFile(config_path.string()));
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("YAML parsing error in " + config_path.string() +
                               ": " + std::string(e.what()));
    }
  }

  static MinifierConfig parse(const YAML::Node &yaml) {
    MinifierConfig config;

    if (!yaml.IsDefined() || yaml.IsNull()) {
      return config;
    }
    if (!yaml.IsMap()) {
      throw std::runtime_error("Config root must be a mapping");
    }

    std::unordered_set<std::string> known_keys = {
        "root_dir", "cache_dir", "php_comments", "max_nesting_level",
        "inline_tags"};

    for (auto it = yaml.begin(); it != yaml.end(); ++it) {
      std::string key = it->first.as<std::string>();
      if (known_keys.find(key) == known_keys.end()) {
        config.unknown_keys.push_back(key);
      }
    }

    if (yaml["root_dir"])
      config.root_dir = yaml["root_dir"].as<std::string>();
    if (yaml["cache_dir"])
      config.cache_dir = yaml["cache_dir"].as<std::string>();
    if (yaml["php_comments"])
      config.php_comments = yaml["php_comments"].as<bool>();
    if (yaml["max_nesting_level"])
      config.max_nesting_level =
          yaml["max_nesting_level"].as<std::size_t>();

    if (yaml["inline_tags"]) {
      config.inline_tags = yaml["inline_tags"].as<std::vector<std::string>>();
    }

    return config;
  }
};

#endif
