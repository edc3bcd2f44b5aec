#include "stabcheck/observability/log_observer.hpp"

#include "stabcheck/common/fs.hpp"
#include "stabcheck/common/json_util.hpp"
#include "stabcheck/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace stabcheck::observability {

namespace {

std::string fmt_ms(const double value) { return common::json_number(value, 1); }

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &raw) {
  const std::string level = common::to_lower(common::trim(raw));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "info") {
    return LogLevel::Info;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver() : LogObserver(LogOptions{}) {}

LogObserver::LogObserver(LogOptions options)
    : options_(std::move(options)),
      console_(options_.console != nullptr ? options_.console : &std::cerr) {
  if (options_.log_file.empty()) {
    return;
  }
  if (options_.log_file.has_parent_path()) {
    const auto dir = common::ensure_dir(options_.log_file.parent_path());
    if (!dir.ok()) {
      *console_ << "[WARN] log file disabled: " << dir.error() << "\n";
      return;
    }
  }
  file_.open(options_.log_file, std::ios::app);
  if (!file_.is_open()) {
    *console_ << "[WARN] log file disabled: unable to open " << options_.log_file.string()
              << "\n";
  }
}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < options_.min_level) {
    return;
  }
  std::string line = common::now_rfc3339() + " [" + std::string(log_level_name(level)) + "] ";
  if (!options_.run_id.empty()) {
    line += "run=" + options_.run_id + " ";
  }
  line += message;

  std::lock_guard<std::mutex> lock(mutex_);
  *console_ << line << "\n";
  if (file_.is_open()) {
    file_ << line << "\n";
  }
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line(LogLevel::Info, "run.start url=" + evt.url +
                                       " duration_s=" + common::json_number(evt.duration_seconds) +
                                       " interval_s=" + common::json_number(evt.interval_seconds) +
                                       " timeout_s=" + common::json_number(evt.timeout_seconds));
        } else if constexpr (std::is_same_v<T, ProbeEvent>) {
          std::string message = "probe index=" + std::to_string(evt.index) +
                                " success=" + (evt.success ? "true" : "false") +
                                " latency_ms=" + fmt_ms(evt.latency_ms);
          if (evt.status_code.has_value()) {
            message += " status=" + std::to_string(*evt.status_code);
          }
          if (!evt.error.empty()) {
            message += " error=" + evt.error;
          }
          if (!evt.detail.empty()) {
            message += " detail=\"" + evt.detail + "\"";
          }
          log_line(evt.success ? LogLevel::Debug : LogLevel::Warn, message);
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          log_line(LogLevel::Info, "run.end state=" + evt.state +
                                       " total=" + std::to_string(evt.total_probes) +
                                       " successful=" + std::to_string(evt.successful_probes) +
                                       " elapsed_ms=" + std::to_string(evt.elapsed.count()));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProbeLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.probe_latency_ms=" + fmt_ms(m.latency_ms));
        } else if constexpr (std::is_same_v<T, AvailabilityMetric>) {
          log_line(LogLevel::Info,
                   "metric.availability_pct=" + common::json_number(m.availability_pct, 2));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  console_->flush();
  if (file_.is_open()) {
    file_.flush();
  }
}

} // namespace stabcheck::observability
