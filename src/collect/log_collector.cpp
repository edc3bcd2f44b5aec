#include "stabcheck/collect/log_collector.hpp"

#include "stabcheck/common/fs.hpp"
#include "stabcheck/observability/global.hpp"

namespace stabcheck::collect {

DockerLogCollector::DockerLogCollector(DockerLogOptions options,
                                       std::shared_ptr<IDockerRunner> runner)
    : options_(options), runner_(std::move(runner)) {}

common::Result<std::string> DockerLogCollector::collect(const std::string &container) {
  const std::string name = common::trim(container);
  if (name.empty()) {
    return common::Result<std::string>::failure("container id is empty",
                                                common::ErrorKind::LogCollection);
  }
  if (name.front() == '-') {
    return common::Result<std::string>::failure("invalid container id: " + name,
                                                common::ErrorKind::LogCollection);
  }

  std::vector<std::string> args = {"logs"};
  if (options_.tail_lines > 0) {
    args.emplace_back("--tail");
    args.push_back(std::to_string(options_.tail_lines));
  }
  args.push_back(name);

  DockerCommandOptions command;
  command.timeout = options_.timeout;
  const auto result = runner_->run(args, command);
  if (!result.ok()) {
    return common::Result<std::string>::failure(
        "docker logs " + name + ": " + common::trim(result.error()),
        common::ErrorKind::LogCollection);
  }

  std::string merged = result.value().stdout_text;
  const std::string &stderr_text = result.value().stderr_text;
  if (!stderr_text.empty()) {
    if (!merged.empty() && merged.back() != '\n') {
      merged.push_back('\n');
    }
    merged += stderr_text;
  }
  if (result.value().truncated) {
    const std::string note = "log output truncated at " +
                             std::to_string(command.max_output_bytes) + " bytes per stream";
    observability::record_warning("collect", "docker logs " + name + ": " + note);
    if (!merged.empty() && merged.back() != '\n') {
      merged.push_back('\n');
    }
    merged += "[stabcheck: " + note + "]\n";
  }
  return common::Result<std::string>::success(std::move(merged));
}

} // namespace stabcheck::collect
