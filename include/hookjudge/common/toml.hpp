#pragma once

#include "hookjudge/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hookjudge::common {

/// Flat view of a TOML file. Keys inside `[section]` tables are stored as
/// "section.key"; values are kept in their raw source form and decoded on access.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] bool is_string(const std::string &key) const;
  [[nodiscard]] bool is_array(const std::string &key) const;
  /// True for an array whose elements are all single quoted strings; `[]` qualifies.
  [[nodiscard]] bool is_string_array(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] std::vector<std::string> keys() const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace hookjudge::common
