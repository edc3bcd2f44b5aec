#pragma once

#include "stabcheck/common/result.hpp"
#include "stabcheck/common/toml.hpp"
#include "stabcheck/config/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stabcheck::config {

constexpr double DEFAULT_TIMEOUT_SECONDS = 5.0;
/// Upper bound for duration, interval and timeout (one year).
constexpr double MAX_WINDOW_SECONDS = 366.0 * 24.0 * 3600.0;
constexpr int MIN_HTTP_STATUS = 100;
constexpr int MAX_HTTP_STATUS = 599;

[[nodiscard]] std::string method_name(HttpMethod method);
[[nodiscard]] common::Result<HttpMethod> parse_method(const std::string &raw);

/// True for an absolute http:// or https:// URL with a non-empty host.
[[nodiscard]] bool is_valid_url(const std::string &url);

/// Overlay the keys present in `doc` onto `config`.
[[nodiscard]] common::Status apply_toml(Config &config, const common::TomlDocument &doc);

/// Defaults overlaid with the TOML profile at `path`.
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);

void apply_env_overrides(Config &config);

/// Range-checked conversions shared by the TOML and flag layers.
[[nodiscard]] common::Result<int> checked_http_status(double value);
[[nodiscard]] common::Result<std::uint32_t> checked_tail_lines(double value);

/// Hard errors fail with ErrorKind::Config; soft findings come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Validate `config` and freeze it into the RunConfig the scheduler consumes.
/// An unset timeout resolves to min(DEFAULT_TIMEOUT_SECONDS, interval).
[[nodiscard]] common::Result<RunConfig> make_run_config(const Config &config);

/// The checks the scheduler repeats before its first probe.
[[nodiscard]] common::Status validate_run_config(const RunConfig &config);

} // namespace stabcheck::config
