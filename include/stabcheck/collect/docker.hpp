#pragma once

#include "stabcheck/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace stabcheck::collect {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  // Output beyond this many bytes per stream is dropped.
  std::size_t max_output_bytes = 4 * 1024 * 1024;
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool truncated = false;
};

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

/// Runs `docker <args...>` as a child process, killing it once the timeout
/// elapses.
class DockerCliRunner final : public IDockerRunner {
public:
  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;
};

} // namespace stabcheck::collect
