#include "stabcheck/common/digest.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <random>
#include <sstream>
#include <vector>

namespace stabcheck::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    static std::mt19937_64 rng{std::random_device{}()};
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(rng() & 0xFFU);
    }
  }
  return to_hex(data.data(), data.size());
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

} // namespace stabcheck::common
