#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local WF_ASSERT macro; this header only
// carries the path of the bundled content so every test loads the same file.

#include <string>

namespace walkforage_test {

inline const std::string kLithicContent = "data/content/lithic_era.json";

} // namespace walkforage_test
