#include <privdrop/errors.hpp>
#include <privdrop/volumes.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace privdrop {
namespace volumes {

void ensure_directories(const std::vector<fs::path> &dirs) {
  for (const auto &d : dirs) {
    std::error_code ec;
    bool created = fs::create_directories(d, ec);
    if (ec)
      throw DirectoryCreationError(fmt::format("cannot create {}", d.string()), ec);
    // create_directories reports success for an existing non-directory on some libstdc++ versions
    if (!fs::is_directory(d, ec))
      throw DirectoryCreationError(
          fmt::format("{} exists and is not a directory", d.string()),
          ec ? ec : errno_code(ENOTDIR));
    spdlog::info("[dirs] {} {}", d.string(), created ? "created" : "present");
  }
}

// lchown unless already owned. Returns false if the entry disappeared.
static bool fix_entry(const fs::path &p, uid_t uid, gid_t gid, RepairStats &st) {
  struct stat sb {};
  if (::lstat(p.c_str(), &sb) != 0) {
    if (errno == ENOENT) {
      spdlog::debug("[chown] {} vanished during walk", p.string());
      return false;
    }
    throw OwnershipRepairError(fmt::format("stat {}", p.string()), errno_code(errno));
  }
  ++st.visited;
  if (sb.st_uid == uid && sb.st_gid == gid)
    return true;

  if (::lchown(p.c_str(), uid, gid) != 0) {
    if (errno == ENOENT) {
      spdlog::debug("[chown] {} vanished during walk", p.string());
      return false;
    }
    throw OwnershipRepairError(
        fmt::format("chown {} to {}:{}", p.string(), uid, gid), errno_code(errno));
  }
  ++st.changed;
  return true;
}

RepairStats repair_tree(const fs::path &root, uid_t uid, gid_t gid,
                        const EntryObserver &on_entry) {
  RepairStats st;
  std::error_code ec;

  // a symlinked mount point is repaired at its target
  fs::path top = fs::canonical(root, ec);
  if (ec)
    throw OwnershipRepairError(fmt::format("resolve {}", root.string()), ec);

  if (!fix_entry(top, uid, gid, st))
    throw OwnershipRepairError(fmt::format("{} disappeared", top.string()),
                               errno_code(ENOENT));

  fs::recursive_directory_iterator it(top, fs::directory_options::none, ec);
  if (ec)
    throw OwnershipRepairError(fmt::format("open {}", top.string()), ec);

  while (it != fs::recursive_directory_iterator()) {
    if (on_entry)
      on_entry(it->path());
    // a vanished directory must not be descended into
    if (!fix_entry(it->path(), uid, gid, st))
      it.disable_recursion_pending();
    it.increment(ec);
    if (ec)
      throw OwnershipRepairError(fmt::format("walk {}", top.string()), ec);
  }
  return st;
}

RepairStats repair_ownership(const std::vector<fs::path> &dirs, uid_t uid,
                             gid_t gid) {
  RepairStats total;
  for (const auto &d : dirs) {
    auto st = repair_tree(d, uid, gid);
    spdlog::info("[chown] {} -> {}:{} ({} entries, {} changed)", d.string(), uid,
                 gid, st.visited, st.changed);
    total.visited += st.visited;
    total.changed += st.changed;
  }
  return total;
}

} // namespace volumes
} // namespace privdrop
