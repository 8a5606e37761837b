#include <privdrop/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace privdrop {

spdlog::level::level_enum parse_log_level(const char *value) {
  if (!value || !*value)
    return spdlog::level::info;
  std::string v = value;
  auto lvl = spdlog::level::from_str(v);
  // from_str maps anything it does not know to off
  if (lvl == spdlog::level::off && v != "off")
    return spdlog::level::info;
  return lvl;
}

void init_logging() {
  auto logger = spdlog::get("privdrop");
  if (!logger)
    logger = spdlog::stderr_color_mt("privdrop");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  const char *env = ::getenv("PRIVDROP_LOG_LEVEL");
  auto lvl = parse_log_level(env);
  spdlog::set_level(lvl);
  if (env && *env && lvl == spdlog::level::info && std::string(env) != "info")
    spdlog::warn("[config] unknown PRIVDROP_LOG_LEVEL={}, using info", env);
}

} // namespace privdrop
