// jlint/lint/rule.cpp - Property parsing helpers
#include "jlint/lint/rule.hpp"

#include <cctype>

namespace jlint::props
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::optional<bool> parse_bool(std::string_view raw)
{
  const std::string_view v = trim(raw);
  if (iequals(v, "true")) return true;
  if (iequals(v, "false")) return false;
  return std::nullopt;
}

}  // namespace

bool get_bool(const Properties & properties, std::string_view key, bool fallback)
{
  const auto it = properties.find(key);
  if (it == properties.end()) {
    return fallback;
  }
  return parse_bool(it->second).value_or(fallback);
}

bool is_malformed_bool(const Properties & properties, std::string_view key)
{
  const auto it = properties.find(key);
  return it != properties.end() && !parse_bool(it->second).has_value();
}

}  // namespace jlint::props
