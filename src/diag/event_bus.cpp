#include "arcio/diag/event_bus.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <new>
#include <sstream>

#include "arcio/config.h"
#include "arcio/crypto/sha256.h"

namespace arcio::diag {
namespace {

struct EventBusSingletonStorage { // manage singleton lifetime
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() { // allow deterministic teardown
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish deadlocks
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

std::string RenderFieldValue(const EventField& field) {
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    return "\"[redacted]\"";
  case FieldPrivacy::kHash:
    return "\"hash:" + HashForTelemetry(field.value) + "\"";
  case FieldPrivacy::kPublic:
    break;
  }
  if (field.numeric && !field.value.empty()) {
    return field.value;
  }
  return "\"" + EscapeJson(field.value) + "\"";
}

}  // namespace

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (lowered == SeverityToString(severity)) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto digest = crypto::SHA256_Hash(input);
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::string BuildEventJson(const Event& event, std::string_view timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    payload.append(",\"").append(EscapeJson(field.key)).append("\":").append(RenderFieldValue(field));
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger() {
  const IoConfig config = LoadIoConfig();
  min_severity_ = config.log_level;
  if (config.log_path) {
    file_.open(*config.log_path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    }
  }
  sink_ = file_.is_open() ? static_cast<std::ostream*>(&file_) : &std::clog;
}

JsonLineLogger::JsonLineLogger(std::ostream& sink, EventSeverity min_severity)
    : sink_(&sink), min_severity_(min_severity) {}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (static_cast<int>(event.severity) < static_cast<int>(min_severity_)) {
    return;
  }
  auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  (*sink_) << line << '\n';
  sink_->flush();
}

void JsonLineLogger::SetMinSeverity(EventSeverity severity) {
  std::lock_guard<std::mutex> guard(mutex_);
  min_severity_ = severity;
}

EventSeverity JsonLineLogger::MinSeverity() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return min_severity_;
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus::~EventBus() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() {
      storage.instance = std::make_unique<EventBus>(); // lazy init
    });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace arcio::diag
