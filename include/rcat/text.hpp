#pragma once
#include <optional>
#include <string>
#include <utility>

namespace rcat {

std::string trim(std::string s);

// "key = value" -> {"key", "value"}, both trimmed. Blank lines, '#'/';'
// comments, [section] headers and lines without '=' yield nullopt.
std::optional<std::pair<std::string, std::string>> split_key_value(const std::string& line);

} // namespace rcat
