#ifndef MINIFIED_CACHE_STORE_HPP
#define MINIFIED_CACHE_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Maps template sources under root_dir to minified copies under cache_dir.
// Relative paths taken and returned by this class are relative to cache_dir.
class MinifiedCacheStore {
private:
  fs::path root_dir;
  fs::path cache_dir;

public:
  MinifiedCacheStore(const fs::path &root, const fs::path &cache);

  std::optional<std::string> read_source(const fs::path &file) const;

  bool exists() const;
  bool exists(const fs::path &relative) const;
  void create() const;

  // Writes to a uniquely named sibling temporary file, then renames it over
  // the target.
  void write_file(const fs::path &relative, const std::string &content) const;

  fs::path absolute_path(const fs::path &relative) const;

  // Path of `file` relative to root_dir. Files outside root_dir keep their
  // whole path minus the root name.
  fs::path relative_path(const fs::path &file) const;

  static fs::path resolve_real_path(const fs::path &file);

  const fs::path &get_root_dir() const { return root_dir; }
  const fs::path &get_cache_dir() const { return cache_dir; }
};

#endif // MINIFIED_CACHE_STORE_HPP
