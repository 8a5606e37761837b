#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace privdrop {

// The unprivileged account the application runs as.
struct Principal {
  std::string user;
  uid_t uid{0};
  gid_t gid{0};
};

// Fixed at image-build time; read once per container start.
struct Config {
  std::vector<std::filesystem::path> directories;
  Principal principal;
  std::uint16_t monitor_port{0};

  // Values baked in through the PRIVDROP_* compile definitions.
  static Config builtin();

  // Range-checks the raw numbers before narrowing them. Throws ConfigError
  // for ids that do not fit uid_t/gid_t (or equal the -1 "unchanged"
  // sentinel) and ports outside 1..65535.
  static Config from_values(const std::string &dirs, const std::string &user,
                            long long uid, long long gid, long long port);

  // Throws ConfigError on the first violated precondition.
  void validate() const;
};

// "/app/logs:/app/data" -> {"/app/logs", "/app/data"}; empty items dropped.
std::vector<std::filesystem::path> split_path_list(const std::string &list);

} // namespace privdrop
