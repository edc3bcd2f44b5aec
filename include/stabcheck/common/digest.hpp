#pragma once

#include <cstddef>
#include <string>

namespace stabcheck::common {

/// Lowercase hex of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Lowercase hex SHA-256 of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace stabcheck::common
