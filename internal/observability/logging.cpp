#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace fieldlink::observability {
namespace {

std::string LevelName(const fieldlink::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("FIELDLINK_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

// spdlog maps unknown names to `off`; a typo must not silence the service
spdlog::level::level_enum ResolveLevel(const fieldlink::runtime::config::RuntimeConfig& config) {
  const auto name  = LevelName(config);
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigError("unknown log level `" + name + "`");
  }
  return level;
}

std::string ResolvePattern(const fieldlink::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("FIELDLINK_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    // logfmt: values with spaces or quotes are quoted
    if (field.value.empty() || field.value.find_first_of(" \"=") != std::string::npos) {
      out << '"';
      for (char c : field.value) {
        if (c == '"' || c == '\\') out << '\\';
        out << c;
      }
      out << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
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

void InitializeLogging(const fieldlink::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("fieldlink");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace fieldlink::observability
