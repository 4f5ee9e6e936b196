#pragma once

#include <string>
#include <vector>

namespace walkforage {

std::string to_lower(std::string s);

std::string trim(const std::string& s);

// Joins with `sep` ("a, b, c" by default).
std::string join(const std::vector<std::string>& parts, const std::string& sep = ", ");

// Splits on `sep`, trimming each token and dropping empty ones.
std::vector<std::string> split_list(const std::string& s, char sep = ',');

} // namespace walkforage
