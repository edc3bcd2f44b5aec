#pragma once

#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stabcheck::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

inline void require_near(double actual, double expected, double tolerance,
                         const std::string &message) {
  if (std::fabs(actual - expected) > tolerance) {
    throw std::runtime_error(message + " (expected " + std::to_string(expected) + ", got " +
                             std::to_string(actual) + ")");
  }
}

} // namespace stabcheck::tests
