#pragma once

#include <string>

namespace walkforage {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are retried
// against WALKFORAGE_SOURCE_DIR (when defined) and the working directory's
// parents, so data/ paths work when tests run from a build tree.
std::string read_text_file(const std::string& path);

// Returns the path read_text_file() would open for `path`, or `path` itself
// when no candidate exists.
std::string resolve_data_path(const std::string& path);

} // namespace walkforage
