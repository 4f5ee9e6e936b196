#pragma once

#include <string>

namespace walkforage {

enum class ContentIssueSeverity { Error, Warning };

// A single content-integrity finding.
//
// `code` is a stable dotted identifier (e.g. "tech.prereq_cycle") that tests
// and tooling can match on; `message` is for humans.
struct ContentIssue {
  ContentIssueSeverity severity{ContentIssueSeverity::Error};
  std::string code;
  std::string message;

  // "resource_type", "material", "tech", "craftable" or "content".
  std::string subject_kind;
  std::string subject_id;
};

} // namespace walkforage
