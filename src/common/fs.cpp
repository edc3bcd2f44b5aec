#include "stabcheck/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace stabcheck::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::size_t utf8_sequence_length(const std::string &value, const std::size_t pos) {
  if (pos >= value.size()) {
    return 0;
  }
  const auto byte_at = [&value](const std::size_t i) {
    return static_cast<unsigned char>(value[i]);
  };
  const unsigned char lead = byte_at(pos);
  if (lead < 0x80U) {
    return 1;
  }

  std::size_t length = 0;
  unsigned char second_min = 0x80U;
  unsigned char second_max = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    if (lead == 0xE0U) {
      second_min = 0xA0U;
    } else if (lead == 0xEDU) {
      second_max = 0x9FU;
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    if (lead == 0xF0U) {
      second_min = 0x90U;
    } else if (lead == 0xF4U) {
      second_max = 0x8FU;
    }
  } else {
    return 0;
  }

  if (pos + length > value.size()) {
    return 0;
  }
  const unsigned char second = byte_at(pos + 1);
  if (second < second_min || second > second_max) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    const unsigned char next = byte_at(pos + i);
    if (next < 0x80U || next > 0xBFU) {
      return 0;
    }
  }
  return length;
}

std::string truncate_utf8(const std::string &value, const std::size_t max_bytes) {
  std::size_t end = 0;
  while (end < value.size()) {
    const std::size_t length = std::max<std::size_t>(1, utf8_sequence_length(value, end));
    if (end + length > max_bytes) {
      break;
    }
    end += length;
  }
  return value.substr(0, end);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      value.replace(0, 1, home);
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("Unable to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (path.empty()) {
    return Status::error("output path is empty");
  }
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  const auto temp_path = path.string() + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("Unable to open file for writing: " + temp_path);
    }
    out << content;
    out.flush();
    if (!out) {
      return Status::error("Failed while writing: " + temp_path);
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return Status::error("Failed to move " + temp_path + " into place: " + ec.message());
  }
  return Status::success();
}

Status append_line(const std::filesystem::path &path, const std::string &line) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }
  std::ofstream out(path, std::ios::app);
  if (!out) {
    return Status::error("Unable to open log file: " + path.string());
  }
  out << line << '\n';
  if (!out) {
    return Status::error("Failed while appending to: " + path.string());
  }
  return Status::success();
}

} // namespace stabcheck::common
