#pragma once

#include "stabcheck/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace stabcheck::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Byte length of the well-formed UTF-8 sequence starting at `pos`, or 0 when
/// the bytes there are not one.
[[nodiscard]] std::size_t utf8_sequence_length(const std::string &value, std::size_t pos);

/// Longest prefix of at most `max_bytes` that does not split a UTF-8 sequence.
[[nodiscard]] std::string truncate_utf8(const std::string &value, std::size_t max_bytes);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write through a sibling temp file and rename it into place.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Append one line to a text file, creating it (and its parent) on first use.
[[nodiscard]] Status append_line(const std::filesystem::path &path, const std::string &line);

} // namespace stabcheck::common
