#pragma once

#include "stabcheck/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace stabcheck::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Accepts debug, info, warn (or warning) and error, case-insensitively.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &raw);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

struct LogOptions {
  LogLevel min_level = LogLevel::Info;
  std::string run_id;
  // Empty disables the file sink. Lines are appended, never truncated.
  std::filesystem::path log_file;
  std::ostream *console = nullptr;
};

/// Writes one line per event to the console (stderr unless overridden) and,
/// when configured, to an append-only log file.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(LogOptions options);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] bool file_sink_open() const { return file_.is_open(); }

private:
  void log_line(LogLevel level, const std::string &message);

  LogOptions options_;
  std::ostream *console_;
  std::ofstream file_;
  std::mutex mutex_;
};

} // namespace stabcheck::observability
