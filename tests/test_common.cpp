#include "test_framework.hpp"

#include "stabcheck/common/cancel_token.hpp"
#include "stabcheck/common/clock.hpp"
#include "stabcheck/common/digest.hpp"
#include "stabcheck/common/fs.hpp"
#include "stabcheck/common/json_util.hpp"
#include "stabcheck/common/time.hpp"
#include "stabcheck/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <limits>
#include <thread>

void register_common_tests(std::vector<stabcheck::tests::TestCase> &tests) {
  using stabcheck::tests::require;
  using stabcheck::tests::require_near;
  namespace common = stabcheck::common;
  using stabcheck::testing::TempWorkspace;

  tests.push_back({"toml_sections_flatten_to_dotted_keys", [] {
                     const auto doc = common::parse_toml(R"(
# comment
[target]
url = "http://x/#frag" # trailing
[run]
interval_seconds = 0.5
)");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("target.url") == "http://x/#frag",
                             "hash inside quotes is kept");
                     require_near(doc.value().get_double("run.interval_seconds").value_or(0.0), 0.5,
                                  1e-12, "double value");
                     require(doc.value().has("run.interval_seconds") && !doc.value().has("interval_seconds"),
                             "keys are qualified by section");
                   }});

  tests.push_back({"toml_rejects_line_without_equals", [] {
                     const auto doc = common::parse_toml("[run]\nduration_seconds\n");
                     require(!doc.ok(), "missing '=' should fail");
                     require(doc.kind() == common::ErrorKind::Config, "config kind");
                     require(doc.error().find("line 2") != std::string::npos, "line number");
                   }});

  tests.push_back({"json_escape_handles_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "basic escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control escaped as \\u");
                     require(common::json_unescape("line\\nnext\\u0041") == "line\nnextA",
                             "unescape");
                   }});

  tests.push_back({"json_escape_keeps_utf8_and_replaces_malformed_bytes", [] {
                     require(common::json_escape("caf\xC3\xA9") == "caf\xC3\xA9",
                             "well-formed UTF-8 copied through");
                     require(common::json_escape("a\xFF" "b") == "a\\ufffdb", "stray byte");
                     require(common::json_escape("\xE2\x82") == "\\ufffd\\ufffd",
                             "truncated sequence");
                     require(common::json_escape("\xED\xA0\x80").find("\\ufffd") == 0,
                             "surrogate encoding rejected");
                     require(common::json_unescape("\\ufffd") == "\xEF\xBF\xBD",
                             "replacement character decodes to UTF-8");
                   }});

  tests.push_back({"utf8_truncate_respects_character_boundaries", [] {
                     const std::string text = "ab\xC3\xA9";
                     require(common::truncate_utf8(text, 3) == "ab", "split character dropped");
                     require(common::truncate_utf8(text, 4) == text, "whole character kept");
                     require(common::truncate_utf8(text, 10) == text, "short input unchanged");
                     require(common::utf8_sequence_length("\xF0\x9F\x98\x80", 0) == 4,
                             "four-byte sequence");
                     require(common::utf8_sequence_length("\xC0\xAF", 0) == 0, "overlong form");
                   }});

  tests.push_back({"json_number_renders_null_for_non_finite", [] {
                     require(common::json_number(1.5) == "1.500", "fixed precision");
                     require(common::json_number(std::numeric_limits<double>::infinity()) == "null", "infinity is null");
                     require(common::json_number_or_null(std::nullopt) == "null", "absent is null");
                     require(common::json_string_or_null(std::nullopt) == "null", "absent string");
                   }});

  tests.push_back({"json_readers_extract_nested_fields", [] {
                     const std::string json =
                         R"({"statistics": {"total_probes": 3, "p50_latency_ms": null},)"
                         R"( "run": {"run_id": "ab\"c"}})";
                     const auto stats = common::json_get_object(json, "statistics");
                     require(common::json_get_number(stats, "total_probes") == "3", "number");
                     require(common::json_is_null(stats, "p50_latency_ms"), "null detected");
                     require(common::json_get_number(stats, "p50_latency_ms").empty(),
                             "null is not a number");
                     require(common::json_get_string(common::json_get_object(json, "run"),
                                                     "run_id") == "ab\"c",
                             "escaped string");
                   }});

  tests.push_back({"fs_atomic_write_and_append", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "file.txt";
                     require(common::write_file_atomic(path, "first").ok(), "atomic write");
                     require(common::read_file(path).value() == "first", "content written");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temp file removed");

                     const auto log = workspace.path() / "logs" / "run.log";
                     require(common::append_line(log, "one").ok(), "append one");
                     require(common::append_line(log, "two").ok(), "append two");
                     require(common::read_file(log).value() == "one\ntwo\n", "appended lines");
                   }});

  tests.push_back({"digest_sha256_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc)");
                     const auto id = common::random_hex(8);
                     require(id.size() == 16, "8 bytes is 16 hex chars");
                     require(id != common::random_hex(8), "ids differ");
                   }});

  tests.push_back({"time_formats_utc_with_millis", [] {
                     const auto t = std::chrono::system_clock::time_point{} +
                                    std::chrono::seconds(1767225600) +
                                    std::chrono::milliseconds(42);
                     require(common::format_rfc3339(t) == "2026-01-01T00:00:00.042Z", "rfc3339");
                     require(common::format_compact_utc(t) == "20260101T000000Z", "compact");
                   }});

  tests.push_back({"clock_from_seconds_saturates", [] {
                     require(common::from_seconds(1e11) == std::chrono::nanoseconds::max(),
                             "beyond range saturates");
                     require(common::from_seconds(std::numeric_limits<double>::infinity()) ==
                                 std::chrono::nanoseconds::max(),
                             "infinity saturates");
                     require(common::from_seconds(-1.0) == std::chrono::nanoseconds::zero(),
                             "negative is zero");
                     require(common::from_seconds(2.5) == std::chrono::milliseconds(2500),
                             "in-range conversion");
                   }});

  tests.push_back({"cancel_token_wakes_sleeping_clock", [] {
                     common::CancelToken token;
                     common::SystemClock clock;
                     std::thread canceller([&token]() {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                       token.cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const bool completed = clock.sleep_for(std::chrono::seconds(10), token);
                     canceller.join();
                     require(!completed, "sleep should report cancellation");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "sleep should end early");
                     require(!clock.sleep_for(std::chrono::milliseconds(1), token),
                             "cancelled token stays cancelled");
                   }});
}
