#pragma once
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

// Tiny CSV helpers shared by the catalog, config and lap-history loaders.
// No quoted fields; loaders stay tolerant and skip rows they cannot parse.
namespace pitwall::csv {

inline std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Strips a trailing "# ..." comment, then splits on commas and trims each cell.
inline std::vector<std::string> split_line(const std::string& line) {
  const auto hash = line.find('#');
  const std::string body = hash == std::string::npos ? line : line.substr(0, hash);
  std::vector<std::string> cols;
  std::string cur;
  for (char c : body) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

inline bool is_skippable(const std::string& raw) {
  return raw.empty() || raw[0] == '#';
}

inline double to_double_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

inline long long to_int_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    long long v = std::stoll(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0;
  }
}

// Accepts 1/0, true/false, yes/no (case-insensitive).
inline bool to_bool_safe(const std::string& s, bool& ok) {
  const auto v = lower(s);
  ok = true;
  if (v == "1" || v == "true" || v == "yes") return true;
  if (v == "0" || v == "false" || v == "no") return false;
  ok = false;
  return false;
}

} // namespace pitwall::csv
