#include "stabcheck/config/config.hpp"

#include "stabcheck/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace stabcheck::config {

namespace {

common::Status config_error(const std::string &message) {
  return common::Status::error(message, common::ErrorKind::Config);
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

bool is_positive(const double value) { return std::isfinite(value) && value > 0.0; }

common::Status check_window(const double value, const std::string &name) {
  if (!is_positive(value)) {
    return config_error(name + " must be > 0");
  }
  if (value > MAX_WINDOW_SECONDS) {
    return config_error(name + " must be <= " +
                        std::to_string(static_cast<long long>(MAX_WINDOW_SECONDS)));
  }
  return common::Status::success();
}

common::Status read_double(const common::TomlDocument &doc, const std::string &key,
                           double &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto parsed = doc.get_double(key);
  if (!parsed.has_value()) {
    return config_error(key + " must be a number");
  }
  out = *parsed;
  return common::Status::success();
}

common::Status read_optional_double(const common::TomlDocument &doc, const std::string &key,
                                    std::optional<double> &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto parsed = doc.get_double(key);
  if (!parsed.has_value()) {
    return config_error(key + " must be a number");
  }
  out = parsed;
  return common::Status::success();
}

void set_from_env(const char *name, std::string &target) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    target = value;
  }
}

bool is_known_log_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warn" ||
         normalized == "warning" || normalized == "error";
}

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty()) {
    return true;
  }
  std::size_t start = 0;
  while (start <= normalized.size()) {
    const std::size_t comma = normalized.find(',', start);
    const std::string part = common::trim(
        normalized.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (part != "log" && part != "none" && part != "noop") {
      return false;
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return true;
}

} // namespace

std::string method_name(const HttpMethod method) {
  switch (method) {
  case HttpMethod::Get:
    return "GET";
  case HttpMethod::Head:
    return "HEAD";
  }
  return "GET";
}

common::Result<HttpMethod> parse_method(const std::string &raw) {
  const std::string normalized = common::to_lower(common::trim(raw));
  if (normalized.empty() || normalized == "get") {
    return common::Result<HttpMethod>::success(HttpMethod::Get);
  }
  if (normalized == "head") {
    return common::Result<HttpMethod>::success(HttpMethod::Head);
  }
  return common::Result<HttpMethod>::failure("unsupported HTTP method: " + raw +
                                                 " (expected GET or HEAD)",
                                             common::ErrorKind::Config);
}

bool is_valid_url(const std::string &url) {
  const std::string lowered = common::to_lower(url);
  std::string rest;
  if (common::starts_with(lowered, "http://")) {
    rest = url.substr(7);
  } else if (common::starts_with(lowered, "https://")) {
    rest = url.substr(8);
  } else {
    return false;
  }
  if (rest.find_first_of(" \t\r\n") != std::string::npos) {
    return false;
  }
  const std::size_t host_end = rest.find_first_of("/?#");
  const std::string authority = rest.substr(0, host_end);
  const std::size_t at = authority.rfind('@');
  const std::string host_port = at == std::string::npos ? authority : authority.substr(at + 1);
  if (host_port.empty() || host_port.front() == ':') {
    return false;
  }
  const std::size_t colon = host_port.rfind(':');
  if (colon != std::string::npos && host_port.back() != ']') {
    const std::string port = host_port.substr(colon + 1);
    const bool digits_only = std::all_of(port.begin(), port.end(), [](unsigned char c) {
      return std::isdigit(c) != 0;
    });
    if (port.empty() || port.size() > 5 || !digits_only) {
      return false;
    }
  }
  return true;
}

common::Status apply_toml(Config &config, const common::TomlDocument &doc) {
  if (doc.has("target.url")) {
    config.target.url = expand_config_value(doc.get_string("target.url"));
  }
  if (doc.has("target.method")) {
    config.target.method = doc.get_string("target.method");
  }
  if (doc.has("target.expected")) {
    config.target.expected = doc.get_string("target.expected");
  }
  if (doc.has("target.expected_status")) {
    const auto raw = doc.get_double("target.expected_status");
    if (!raw.has_value()) {
      return config_error("target.expected_status must be an integer");
    }
    const auto status = checked_http_status(*raw);
    if (!status.ok()) {
      return common::Status::error("target." + status.error(), common::ErrorKind::Config);
    }
    config.target.expected_status = status.value();
  }

  if (auto status = read_double(doc, "run.duration_seconds", config.run.duration_seconds);
      !status.ok()) {
    return status;
  }
  if (auto status = read_double(doc, "run.interval_seconds", config.run.interval_seconds);
      !status.ok()) {
    return status;
  }
  if (auto status = read_optional_double(doc, "run.timeout_seconds", config.run.timeout_seconds);
      !status.ok()) {
    return status;
  }
  if (auto status = read_optional_double(doc, "run.min_availability_pct",
                                         config.run.min_availability_pct);
      !status.ok()) {
    return status;
  }

  if (doc.has("report.output")) {
    config.report.output = expand_config_value(doc.get_string("report.output"));
  }
  if (doc.has("report.log_file")) {
    config.report.log_file = expand_config_value(doc.get_string("report.log_file"));
  }

  config.docker.container = doc.get_string("docker.container", config.docker.container);
  if (doc.has("docker.tail_lines")) {
    const auto raw = doc.get_double("docker.tail_lines");
    if (!raw.has_value()) {
      return config_error("docker.tail_lines must be an integer");
    }
    const auto lines = checked_tail_lines(*raw);
    if (!lines.ok()) {
      return common::Status::error("docker." + lines.error(), common::ErrorKind::Config);
    }
    config.docker.tail_lines = lines.value();
  }
  if (auto status = read_double(doc, "docker.timeout_seconds", config.docker.timeout_seconds);
      !status.ok()) {
    return status;
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);
  return common::Status::success();
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorKind::Config);
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorKind::Config);
  }

  Config config;
  if (auto status = apply_toml(config, parsed.value()); !status.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + status.error(),
                                           common::ErrorKind::Config);
  }
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  set_from_env("STABCHECK_URL", config.target.url);
  if (const char *expected = std::getenv("STABCHECK_EXPECTED");
      expected != nullptr && *expected != '\0') {
    config.target.expected = std::string(expected);
  }
  set_from_env("STABCHECK_CONTAINER", config.docker.container);
  set_from_env("STABCHECK_OUTPUT", config.report.output);
  set_from_env("STABCHECK_LOG_LEVEL", config.observability.log_level);
}

common::Result<int> checked_http_status(const double value) {
  if (!std::isfinite(value) || std::floor(value) != value) {
    return common::Result<int>::failure("expected_status must be an integer",
                                        common::ErrorKind::Config);
  }
  if (value < MIN_HTTP_STATUS || value > MAX_HTTP_STATUS) {
    return common::Result<int>::failure("expected_status must be between 100 and 599",
                                        common::ErrorKind::Config);
  }
  return common::Result<int>::success(static_cast<int>(value));
}

common::Result<std::uint32_t> checked_tail_lines(const double value) {
  if (!std::isfinite(value) || std::floor(value) != value || value < 0.0) {
    return common::Result<std::uint32_t>::failure("tail_lines must be a non-negative integer",
                                                  common::ErrorKind::Config);
  }
  if (value > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return common::Result<std::uint32_t>::failure("tail_lines is too large",
                                                  common::ErrorKind::Config);
  }
  return common::Result<std::uint32_t>::success(static_cast<std::uint32_t>(value));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.target.url).empty()) {
    return Warnings::failure("target url is required", common::ErrorKind::Config);
  }
  if (!is_valid_url(config.target.url)) {
    return Warnings::failure("invalid target url: " + config.target.url,
                             common::ErrorKind::Config);
  }
  const auto method = parse_method(config.target.method);
  if (!method.ok()) {
    return Warnings::failure(method.status());
  }
  if (method.value() == HttpMethod::Head && config.target.expected.has_value()) {
    return Warnings::failure("target.expected requires method GET", common::ErrorKind::Config);
  }
  if (config.target.expected_status.has_value() &&
      (*config.target.expected_status < MIN_HTTP_STATUS ||
       *config.target.expected_status > MAX_HTTP_STATUS)) {
    return Warnings::failure("target.expected_status must be between 100 and 599",
                             common::ErrorKind::Config);
  }

  if (auto status = check_window(config.run.duration_seconds, "duration_seconds"); !status.ok()) {
    return Warnings::failure(status);
  }
  if (auto status = check_window(config.run.interval_seconds, "interval_seconds"); !status.ok()) {
    return Warnings::failure(status);
  }
  if (config.run.interval_seconds > config.run.duration_seconds) {
    return Warnings::failure("interval_seconds must be <= duration_seconds",
                             common::ErrorKind::Config);
  }
  if (config.run.timeout_seconds.has_value()) {
    if (auto status = check_window(*config.run.timeout_seconds, "timeout_seconds");
        !status.ok()) {
      return Warnings::failure(status);
    }
    if (*config.run.timeout_seconds > config.run.interval_seconds) {
      warnings.push_back("timeout_seconds exceeds interval_seconds; a slow probe delays the "
                         "next tick");
    }
  }
  if (config.run.min_availability_pct.has_value()) {
    const double threshold = *config.run.min_availability_pct;
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 100.0) {
      return Warnings::failure("min_availability_pct must be between 0 and 100",
                               common::ErrorKind::Config);
    }
  }

  if (!common::trim(config.docker.container).empty()) {
    if (auto status = check_window(config.docker.timeout_seconds, "docker.timeout_seconds");
        !status.ok()) {
      return Warnings::failure(status);
    }
    if (config.docker.tail_lines == 0) {
      warnings.push_back("docker.tail_lines is 0; the full container log will be captured");
    }
  }

  if (!is_known_log_level(config.observability.log_level)) {
    return Warnings::failure("invalid log level: " + config.observability.log_level +
                                 " (expected debug|info|warn|error)",
                             common::ErrorKind::Config);
  }
  if (!is_known_backend(config.observability.backend)) {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', using log");
  }

  return Warnings::success(std::move(warnings));
}

common::Result<RunConfig> make_run_config(const Config &config) {
  const auto validated = validate_config(config);
  if (!validated.ok()) {
    return common::Result<RunConfig>::failure(validated.status());
  }

  RunConfig run;
  run.url = common::trim(config.target.url);
  run.duration_seconds = config.run.duration_seconds;
  run.interval_seconds = config.run.interval_seconds;
  run.expected = config.target.expected;
  run.timeout_seconds = config.run.timeout_seconds.value_or(
      std::min(DEFAULT_TIMEOUT_SECONDS, config.run.interval_seconds));
  run.method = parse_method(config.target.method).value();
  run.expected_status = config.target.expected_status;
  return common::Result<RunConfig>::success(std::move(run));
}

common::Status validate_run_config(const RunConfig &config) {
  if (!is_valid_url(config.url)) {
    return config_error("invalid target url: " + config.url);
  }
  if (auto status = check_window(config.duration_seconds, "duration_seconds"); !status.ok()) {
    return status;
  }
  if (auto status = check_window(config.interval_seconds, "interval_seconds"); !status.ok()) {
    return status;
  }
  if (config.interval_seconds > config.duration_seconds) {
    return config_error("interval_seconds must be <= duration_seconds");
  }
  if (auto status = check_window(config.timeout_seconds, "timeout_seconds"); !status.ok()) {
    return status;
  }
  return common::Status::success();
}

} // namespace stabcheck::config
