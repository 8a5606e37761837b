#pragma once
#include <spdlog/spdlog.h>

namespace privdrop {

// nullptr or unknown names give info.
spdlog::level::level_enum parse_log_level(const char *value);

// stderr colour logger as default, level from PRIVDROP_LOG_LEVEL.
void init_logging();

} // namespace privdrop
