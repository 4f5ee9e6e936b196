#pragma once

#include <string>
#include <vector>

namespace walkforage {

class ContentDB;
struct SessionState;

// Checks restored session state against the content: unknown resource types
// and materials, non-positive or duplicate stacks, unknown unlocked techs,
// unknown or wrongly-kinded owned items, empty or duplicate instance ids and
// out-of-range qualities. Returns sorted messages; empty means valid.
std::vector<std::string> validate_session_state(const ContentDB& content, const SessionState& state);

} // namespace walkforage
