#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace circulate::runtime::config {
class RuntimeConfig;
}

namespace circulate::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Lines are written as

      <message> key=value key="value with spaces" <scope fields> [trace_id=.. span_id=..]

  Level and pattern come from CIRCULATE_LOG_LEVEL / CIRCULATE_LOG_PATTERN,
  then the logging config, then "info" and an ISO-8601 pattern. Trace ids
  are appended when logging.include_trace_context is set and a span is
  active.
*/
void InitializeLogging(const circulate::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Fields appended to every line this thread logs while the scope is alive.
  Scopes nest; the worker opens one per task invocation so that every line
  of a retried page carries the same task id.
*/
class LogScope {
 public:
  explicit LogScope(std::initializer_list<LogField> fields);
  ~LogScope();

  LogScope(const LogScope&)            = delete;
  LogScope& operator=(const LogScope&) = delete;

  // Fields of every open scope on this thread, outermost first.
  static const std::vector<LogField>& Current();

 private:
  std::size_t depth_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace circulate::observability

#define CIRCULATE_LOG_DEBUG(message, ...) ::circulate::observability::LogDebug((message), ##__VA_ARGS__)
#define CIRCULATE_LOG_INFO(message, ...) ::circulate::observability::LogInfo((message), ##__VA_ARGS__)
#define CIRCULATE_LOG_WARN(message, ...) ::circulate::observability::LogWarn((message), ##__VA_ARGS__)
#define CIRCULATE_LOG_ERROR(message, ...) ::circulate::observability::LogError((message), ##__VA_ARGS__)
