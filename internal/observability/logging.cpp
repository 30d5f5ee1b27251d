#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace entitlement::observability {
namespace {

constexpr char kLoggerName[]     = "entitlement-manager";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LoggingSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{kDefaultPattern};
  bool                      include_trace_context{false};
};

// Environment beats the config file.
std::optional<std::string> EnvOverride(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

LoggingSettings ResolveSettings(const entitlement::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LoggingSettings settings;
  if (auto level = EnvOverride("ENTITLEMENT_LOG_LEVEL")) {
    settings.level = ParseLevel(*level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  if (auto pattern = EnvOverride("ENTITLEMENT_LOG_PATTERN")) {
    settings.pattern = *pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (auto include_trace = EnvOverride("ENTITLEMENT_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = *include_trace == "1" || *include_trace == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

bool g_include_trace_context{false};

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string HexId(const std::array<uint8_t, N>& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(N * 2);
  for (const auto byte : bytes) {
    result.push_back(kHex[(byte >> 4) & 0x0F]);
    result.push_back(kHex[byte & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  std::array<uint8_t, 16> trace_bytes{};
  std::array<uint8_t, 8>  span_bytes{};
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes) + " span_id=" + HexId(span_bytes);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

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

LogField RedactedField(std::string_view key, std::string_view secret) {
  if (secret.size() <= 8) {
    return {std::string(key), "<redacted len=" + std::to_string(secret.size()) + ">"};
  }
  return {std::string(key), "<redacted len=" + std::to_string(secret.size()) + " ..." + std::string(secret.substr(secret.size() - 4)) + ">"};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  // from_str maps unknown names to "off", which would silently mute the server.
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    throw entitlement::util::InvalidConfig("unknown log level: " + std::string(name));
  }
  return level;
}

void InitializeLogging(const entitlement::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  // Null after ShutdownLogging().
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace entitlement::observability
