#pragma once

#include "stabcheck/common/result.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace stabcheck::common {

/// Flat view of a TOML profile: `[section] key = value` becomes "section.key".
/// Values keep their raw text; typed getters convert on access.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::optional<double> get_double(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace stabcheck::common
