#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace circulate::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

thread_local std::vector<LogField> t_scope_fields;

std::atomic<bool> g_trace_context{false};

std::string FromEnv(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) return value;
  return configured.empty() ? fallback : configured;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line.push_back(' ');
  line.append(key);
  line.push_back('=');
  if (!NeedsQuotes(value)) {
    line.append(value);
    return;
  }

  line.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    if (c == '\n') {
      line.append("\\n");
      continue;
    }
    line.push_back(c);
  }
  line.push_back('"');
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogScope::LogScope(std::initializer_list<LogField> fields) : depth_(t_scope_fields.size()) {
  t_scope_fields.insert(t_scope_fields.end(), fields.begin(), fields.end());
}

LogScope::~LogScope() {
  t_scope_fields.resize(depth_);
}

const std::vector<LogField>& LogScope::Current() {
  return t_scope_fields;
}

void InitializeLogging(const circulate::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get("circulate");
  if (!logger) logger = spdlog::stdout_color_mt("circulate");
  logger->set_pattern(FromEnv("CIRCULATE_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnv("CIRCULATE_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_trace_context = logging.include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field.key, field.value);
  for (const auto& field : t_scope_fields) AppendField(line, field.key, field.value);

  if (g_trace_context) {
    if (auto ids = ActiveTraceIds()) {
      AppendField(line, "trace_id", ids->trace_id);
      AppendField(line, "span_id", ids->span_id);
    }
  }

  spdlog::log(level, "{}", line);
}

} // namespace circulate::observability
