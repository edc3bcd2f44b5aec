#pragma once

#include "stabcheck/collect/docker.hpp"
#include "stabcheck/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace stabcheck::collect {

class ILogCollector {
public:
  virtual ~ILogCollector() = default;

  /// Recent log text for `container`. Failures carry ErrorKind::LogCollection.
  [[nodiscard]] virtual common::Result<std::string> collect(const std::string &container) = 0;
};

struct DockerLogOptions {
  // 0 captures the whole log.
  std::uint32_t tail_lines = 200;
  std::chrono::milliseconds timeout{30'000};
};

/// `docker logs --tail N <container>`; stdout and stderr are merged, stdout first.
/// Output cut at the runner's byte cap ends with a `[stabcheck: ...truncated...]` line.
class DockerLogCollector final : public ILogCollector {
public:
  explicit DockerLogCollector(
      DockerLogOptions options = {},
      std::shared_ptr<IDockerRunner> runner = std::make_shared<DockerCliRunner>());

  [[nodiscard]] common::Result<std::string> collect(const std::string &container) override;

private:
  DockerLogOptions options_;
  std::shared_ptr<IDockerRunner> runner_;
};

} // namespace stabcheck::collect
