#include <rcat/text.hpp>
#include <algorithm>
#include <cctype>

namespace rcat {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::optional<std::pair<std::string, std::string>> split_key_value(const std::string& line) {
  const std::string raw = trim(line);
  if (raw.empty()) return std::nullopt;
  if (raw[0] == '#' || raw[0] == ';' || raw[0] == '[') return std::nullopt;

  const auto eq = raw.find('=');
  if (eq == std::string::npos) return std::nullopt;
  std::string key = trim(raw.substr(0, eq));
  if (key.empty()) return std::nullopt;
  return std::make_pair(std::move(key), trim(raw.substr(eq + 1)));
}

} // namespace rcat
