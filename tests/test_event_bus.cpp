#include "arcio/diag/event_bus.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "arcio/core/file_name.h"
#include "arcio/error.h"
#include "arcio/io/stream.h"
#include "arcio/io/stream_util.h"

namespace {

constexpr const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

void TestHashForTelemetry() {
  assert(arcio::diag::HashForTelemetry("abc") == kAbcDigest);
  assert(arcio::diag::HashForTelemetry("").empty());
}

void TestBuildEventJson() {
  arcio::diag::Event event;
  event.category = arcio::diag::EventCategory::kTelemetry;
  event.severity = arcio::diag::EventSeverity::kWarning;
  event.event_id = "sample";
  event.message = "line\nbreak \"quoted\"";
  event.fields.emplace_back("count", "42", arcio::diag::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("name", "abc", arcio::diag::FieldPrivacy::kHash);
  event.fields.emplace_back("secret", "value", arcio::diag::FieldPrivacy::kRedact);

  const std::string json = arcio::diag::BuildEventJson(event, "2024-01-01T00:00:00.000000Z");
  assert(json.front() == '{' && json.back() == '}');
  assert(json.find("\"severity\":\"warning\"") != std::string::npos);
  assert(json.find("\"category\":\"telemetry\"") != std::string::npos);
  assert(json.find("\"message\":\"line\\nbreak \\\"quoted\\\"\"") != std::string::npos);
  assert(json.find("\"count\":42") != std::string::npos);
  assert(json.find(std::string("\"name\":\"hash:") + kAbcDigest + "\"") != std::string::npos);
  assert(json.find("\"secret\":\"[redacted]\"") != std::string::npos);
  assert(json.find("value") == std::string::npos && "redacted values never reach the sink");
}

void TestSeverityParsing() {
  assert(arcio::diag::ParseSeverity("DEBUG") == arcio::diag::EventSeverity::kDebug);
  assert(arcio::diag::ParseSeverity("warning") == arcio::diag::EventSeverity::kWarning);
  assert(!arcio::diag::ParseSeverity("verbose").has_value());
}

void TestLoggerThreshold() {
  std::ostringstream sink;
  arcio::diag::JsonLineLogger logger(sink, arcio::diag::EventSeverity::kInfo);
  arcio::diag::Event quiet;
  quiet.severity = arcio::diag::EventSeverity::kDebug;
  quiet.event_id = "quiet";
  logger.Log(quiet);
  assert(sink.str().empty());

  arcio::diag::Event loud;
  loud.severity = arcio::diag::EventSeverity::kError;
  loud.event_id = "loud";
  logger.Log(loud);
  assert(sink.str().find("\"event_id\":\"loud\"") != std::string::npos);
  assert(sink.str().back() == '\n');

  logger.SetMinSeverity(arcio::diag::EventSeverity::kDebug);
  assert(logger.MinSeverity() == arcio::diag::EventSeverity::kDebug);
  logger.Log(quiet);
  assert(sink.str().find("\"event_id\":\"quiet\"") != std::string::npos);
}

void TestLibraryEventsReachSubscribers() {
  arcio::diag::ResetEventBusForTesting();
  std::vector<arcio::diag::Event> captured;
  arcio::diag::EventBus::Instance().Subscribe(
      [&captured](const arcio::diag::Event& event) { captured.push_back(event); });

  arcio::io::MemoryStream source(std::vector<uint8_t>(3, 0x7));
  std::array<uint8_t, 8> buffer{};
  bool threw = false;
  try {
    arcio::io::ReadExact(&source, buffer, 0, 8);
  } catch (const arcio::Error& error) {
    threw = arcio::IsEndOfStream(error);
  }
  assert(threw);
  assert(!captured.empty() && captured.back().event_id == "read_exact_truncated");
  assert(captured.back().severity == arcio::diag::EventSeverity::kWarning);

  (void)arcio::core::ReplaceInvalidFileNameChars("a/b", arcio::core::FileNameFlavor::kPosix);
  assert(captured.back().event_id == "file_name_sanitized");
  bool hashed = false;
  for (const auto& field : captured.back().fields) {
    if (field.key == "file_name") {
      hashed = field.privacy == arcio::diag::FieldPrivacy::kHash;
    }
  }
  assert(hashed && "file names are hashed before logging");

  const size_t before = captured.size();
  (void)arcio::core::ReplaceInvalidFileNameChars("clean", arcio::core::FileNameFlavor::kPosix);
  assert(captured.size() == before && "unchanged names publish nothing");

  arcio::diag::ResetEventBusForTesting();
  (void)arcio::core::ReplaceInvalidFileNameChars("c/d", arcio::core::FileNameFlavor::kPosix);
  assert(captured.size() == before && "reset drops subscribers");
}

}  // namespace

int main() {
  TestHashForTelemetry();
  TestBuildEventJson();
  TestSeverityParsing();
  TestLoggerThreshold();
  TestLibraryEventsReachSubscribers();
  std::cout << "event bus tests ok\n";
  return 0;
}
