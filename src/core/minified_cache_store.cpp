#include "minified_cache_store.hpp"
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace {

std::atomic<unsigned long> temporary_counter{0};

} // namespace

MinifiedCacheStore::MinifiedCacheStore(const fs::path &root,
                                       const fs::path &cache)
    : root_dir(resolve_real_path(root)),
      cache_dir(resolve_real_path(cache.is_absolute() ? cache
                                                      : root_dir / cache)) {}

fs::path MinifiedCacheStore::resolve_real_path(const fs::path &file) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(file, ec);
  if (ec) {
    return fs::absolute(file).lexically_normal();
  }
  return resolved;
}

std::optional<std::string>
MinifiedCacheStore::read_source(const fs::path &file) const {
  std::ifstream input(file, std::ios::binary);
  if (!input.is_open()) {
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

bool MinifiedCacheStore::exists() const { return fs::is_directory(cache_dir); }

bool MinifiedCacheStore::exists(const fs::path &relative) const {
  return fs::exists(absolute_path(relative));
}

void MinifiedCacheStore::create() const {
  std::error_code ec;
  fs::create_directories(cache_dir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create directory: " + cache_dir.string() +
                             " (" + ec.message() + ")");
  }
}

void MinifiedCacheStore::write_file(const fs::path &relative,
                                    const std::string &content) const {
  fs::path target = absolute_path(relative);

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Cannot create directory: " +
                               target.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  // Unique per process and call; writers of one target never share it.
  fs::path temporary = target;
  temporary += "." + std::to_string(::getpid()) + "." +
               std::to_string(temporary_counter.fetch_add(1)) + ".tmp";

  {
    std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw std::runtime_error("Cannot write file: " + temporary.string());
    }
    file << content;
    file.close();
    if (file.fail()) {
      throw std::runtime_error("Cannot write file: " + temporary.string());
    }
  }

  fs::rename(temporary, target, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(temporary, cleanup);
    throw std::runtime_error("Cannot write file: " + target.string() + " (" +
                             ec.message() + ")");
  }
}

fs::path MinifiedCacheStore::absolute_path(const fs::path &relative) const {
  return cache_dir / relative;
}

fs::path MinifiedCacheStore::relative_path(const fs::path &file) const {
  fs::path normalized = fs::absolute(file).lexically_normal();
  fs::path relative = normalized.lexically_relative(root_dir);

  if (!relative.empty() && *relative.begin() != "..") {
    return relative;
  }
  return normalized.relative_path();
}
