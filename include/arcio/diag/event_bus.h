#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arcio::diag {

  // Structured logging primitives.
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // Hex SHA-256 of |input|, empty for empty input.
  std::string HashForTelemetry(std::string_view input);

  // Renders |event| as a single JSON object (no trailing newline). Hashed
  // fields become "hash:<hex>", redacted fields "[redacted]".
  std::string BuildEventJson(const Event& event, std::string_view timestamp);

  class JsonLineLogger {
  public:
    // Resolves sink and threshold from ARCIO_LOG_PATH / ARCIO_LOG_LEVEL.
    JsonLineLogger();
    JsonLineLogger(std::ostream& sink, EventSeverity min_severity);

    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    void Log(const Event& event);
    void SetMinSeverity(EventSeverity severity);
    [[nodiscard]] EventSeverity MinSeverity() const;

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::ostream* sink_{nullptr};
    EventSeverity min_severity_{EventSeverity::kWarning};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting(); // test-only teardown

} // namespace arcio::diag
