#include "walkforage/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace walkforage {

namespace {

namespace fs = std::filesystem;

bool exists_quiet(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec) && !ec;
}

std::vector<fs::path> search_roots() {
  std::vector<fs::path> roots;
#ifdef WALKFORAGE_SOURCE_DIR
  roots.emplace_back(WALKFORAGE_SOURCE_DIR);
#endif
  std::error_code ec;
  fs::path cur = fs::current_path(ec);
  if (ec) return roots;
  for (int depth = 0; depth < 8 && !cur.empty(); ++depth) {
    roots.push_back(cur);
    const fs::path parent = cur.parent_path();
    if (parent == cur) break;
    cur = parent;
  }
  return roots;
}

} // namespace

std::string resolve_data_path(const std::string& path) {
  const fs::path requested(path);
  if (requested.empty() || requested.is_absolute() || exists_quiet(requested)) return path;

  for (const auto& root : search_roots()) {
    const fs::path candidate = root / requested;
    if (exists_quiet(candidate)) return candidate.string();
  }
  return path;
}

std::string read_text_file(const std::string& path) {
  const std::string resolved = resolve_data_path(path);
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != path) {
      throw std::runtime_error("Failed to open file for reading: " + path + " (resolved to: " + resolved + ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + resolved);
  return ss.str();
}

} // namespace walkforage
