#pragma once

#include <algorithm>
#include <vector>

namespace walkforage::util {

// Keys of an associative container in ascending order.
//
// Session and inventory state is stored in unordered maps; anything that is
// printed, compared in tests or iterated to pick "the first" entry goes
// through here so results do not depend on hash order.
template <typename Map>
std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> out;
  out.reserve(m.size());
  for (const auto& entry : m) out.push_back(entry.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace walkforage::util
