#include <privdrop/config.hpp>
#include <privdrop/errors.hpp>

#include <fmt/format.h>

#include <limits>
#include <set>
#include <sstream>

#ifndef PRIVDROP_USER
#define PRIVDROP_USER "botuser"
#endif
#ifndef PRIVDROP_UID
#define PRIVDROP_UID 1000
#endif
#ifndef PRIVDROP_GID
#define PRIVDROP_GID 1000
#endif
#ifndef PRIVDROP_DIRECTORIES
#define PRIVDROP_DIRECTORIES "/app/logs:/app/data"
#endif
#ifndef PRIVDROP_MONITOR_PORT
#define PRIVDROP_MONITOR_PORT 9090
#endif

namespace fs = std::filesystem;

namespace privdrop {

std::vector<fs::path> split_path_list(const std::string &list) {
  std::vector<fs::path> out;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ':')) {
    if (!item.empty())
      out.emplace_back(item);
  }
  return out;
}

Config Config::builtin() {
  return from_values(PRIVDROP_DIRECTORIES, PRIVDROP_USER, PRIVDROP_UID,
                     PRIVDROP_GID, PRIVDROP_MONITOR_PORT);
}

template <typename Id> static Id narrow_id(long long v, const char *what) {
  // (Id)-1 tells chown/setresuid to leave the id alone
  if (v < 0 || static_cast<unsigned long long>(v) >=
                   static_cast<unsigned long long>(std::numeric_limits<Id>::max()))
    throw ConfigError(fmt::format("{} {} out of range", what, v));
  return static_cast<Id>(v);
}

Config Config::from_values(const std::string &dirs, const std::string &user,
                           long long uid, long long gid, long long port) {
  Config c;
  c.directories = split_path_list(dirs);
  c.principal.user = user;
  c.principal.uid = narrow_id<uid_t>(uid, "uid");
  c.principal.gid = narrow_id<gid_t>(gid, "gid");
  if (port < 1 || port > 65535)
    throw ConfigError(fmt::format("monitor port {} must be in 1..65535", port));
  c.monitor_port = static_cast<std::uint16_t>(port);
  return c;
}

void Config::validate() const {
  if (directories.empty())
    throw ConfigError("no target directories configured");

  std::set<fs::path> seen;
  for (const auto &d : directories) {
    if (!d.is_absolute())
      throw ConfigError(fmt::format("directory is not absolute: {}", d.string()));
    auto norm = d.lexically_normal();
    if (norm == norm.root_path())
      throw ConfigError(fmt::format("refusing to repair filesystem root: {}", d.string()));
    // "/app/logs/" and "/app/logs" are the same target
    if (!norm.has_filename())
      norm = norm.parent_path();
    if (!seen.insert(norm).second)
      throw ConfigError(fmt::format("duplicate directory: {}", d.string()));
  }

  if (principal.user.empty())
    throw ConfigError("principal user name is empty");
  if (principal.uid == static_cast<uid_t>(-1) ||
      principal.gid == static_cast<gid_t>(-1))
    throw ConfigError(fmt::format("principal {} has an invalid uid/gid", principal.user));
  if (principal.uid == 0 || principal.gid == 0)
    throw ConfigError(fmt::format("principal {} must not be uid/gid 0 (got {}:{})",
                                  principal.user, principal.uid, principal.gid));
  if (monitor_port == 0)
    throw ConfigError("monitor port must be in 1..65535");
}

} // namespace privdrop
