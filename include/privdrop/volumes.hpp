#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

#include <sys/types.h>

namespace privdrop {
namespace volumes {

struct RepairStats {
  std::size_t visited{0};
  std::size_t changed{0};
};

// mkdir -p for every path. Throws DirectoryCreationError.
void ensure_directories(const std::vector<std::filesystem::path> &dirs);

// Called with each entry below the root before it is examined.
using EntryObserver = std::function<void(const std::filesystem::path &)>;

// Re-own one tree. Symlinks below the root are re-owned, never followed;
// entries that vanish mid-walk are skipped. Throws OwnershipRepairError.
RepairStats repair_tree(const std::filesystem::path &root, uid_t uid, gid_t gid,
                        const EntryObserver &on_entry = {});

RepairStats repair_ownership(const std::vector<std::filesystem::path> &dirs,
                             uid_t uid, gid_t gid);

} // namespace volumes
} // namespace privdrop
