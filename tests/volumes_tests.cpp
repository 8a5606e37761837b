#include <catch2/catch_all.hpp>
#include <privdrop/errors.hpp>
#include <privdrop/volumes.hpp>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

using namespace privdrop;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("privdrop_vol_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void touch(const fs::path &p) { std::ofstream o(p); o << "x"; }

static struct stat lst(const fs::path &p) {
  struct stat sb {};
  REQUIRE(::lstat(p.c_str(), &sb) == 0);
  return sb;
}

// root, a/, a/f1, a/b/, a/b/f2, top.txt
static void populate(const fs::path &root) {
  fs::create_directories(root / "a" / "b");
  touch(root / "a" / "f1");
  touch(root / "a" / "b" / "f2");
  touch(root / "top.txt");
}

TEST_CASE("ensure_directories creates missing parents and is idempotent") {
  auto d = mkd("ensure");
  auto logs = d / "app" / "logs";
  auto data = d / "app" / "data";

  volumes::ensure_directories({logs, data});
  REQUIRE(fs::is_directory(logs));
  REQUIRE(fs::is_directory(data));

  touch(logs / "keep.log");
  REQUIRE_NOTHROW(volumes::ensure_directories({logs, data}));
  REQUIRE(fs::exists(logs / "keep.log"));
}

TEST_CASE("ensure_directories fails on a non-directory in the way") {
  auto d = mkd("notdir");
  touch(d / "file");

  try {
    volumes::ensure_directories({d / "file"});
    FAIL("expected DirectoryCreationError");
  } catch (const DirectoryCreationError &e) {
    REQUIRE(e.phase() == Phase::EnsureDirectories);
  }

  REQUIRE_THROWS_AS(volumes::ensure_directories({d / "file" / "sub"}),
                    DirectoryCreationError);
}

TEST_CASE("repair to the current owner visits every entry and changes nothing") {
  auto d = mkd("self");
  populate(d);
  auto st = volumes::repair_tree(d, ::getuid(), lst(d).st_gid);
  REQUIRE(st.visited == 6);

  auto again = volumes::repair_tree(d, ::getuid(), lst(d).st_gid);
  REQUIRE(again.visited == 6);
  REQUIRE(again.changed == 0);
}

TEST_CASE("symlinked top-level directory is repaired at its target") {
  auto d = mkd("toplink");
  auto real = d / "real";
  populate(real);
  fs::create_directory_symlink(real, d / "link");

  auto st = volumes::repair_tree(d / "link", ::getuid(), lst(real).st_gid);
  REQUIRE(st.visited == 6);
}

TEST_CASE("subdirectory removed during the walk is skipped") {
  auto d = mkd("vanish");
  populate(d);
  fs::create_directories(d / "gone" / "x");
  touch(d / "gone" / "x" / "f");

  bool removed = false;
  auto st = volumes::repair_tree(d, ::getuid(), lst(d).st_gid,
                                 [&](const fs::path &p) {
                                   if (p.filename() == "gone") {
                                     fs::remove_all(p);
                                     removed = true;
                                   }
                                 });
  REQUIRE(removed);
  REQUIRE_FALSE(fs::exists(d / "gone"));
  REQUIRE(st.visited == 6);
}

TEST_CASE("missing directory is an ownership repair failure") {
  auto d = mkd("missing");
  REQUIRE_THROWS_AS(volumes::repair_ownership({d / "nope"}, ::getuid(), ::getgid()),
                    OwnershipRepairError);
}

TEST_CASE("unprivileged repair to a foreign uid is rejected") {
  if (::geteuid() == 0)
    SKIP("running as root");
  auto d = mkd("eperm");
  touch(d / "f");
  try {
    volumes::repair_tree(d, ::getuid() + 1, ::getgid());
    FAIL("expected OwnershipRepairError");
  } catch (const OwnershipRepairError &e) {
    REQUIRE(e.phase() == Phase::RepairOwnership);
    REQUIRE(e.code().value() == EPERM);
  }
}

TEST_CASE("root-owned tree is re-owned recursively") {
  if (::geteuid() != 0)
    SKIP("needs root");
  auto d = mkd("rootowned");
  populate(d);
  for (auto &e : fs::recursive_directory_iterator(d))
    REQUIRE(::lchown(e.path().c_str(), 0, 0) == 0);
  REQUIRE(::lchown(d.c_str(), 0, 0) == 0);

  auto st = volumes::repair_ownership({d}, 1000, 1000);
  REQUIRE(st.visited == 6);
  REQUIRE(st.changed == 6);

  auto check = [&](const fs::path &p) {
    auto sb = lst(p);
    REQUIRE(sb.st_uid == 1000);
    REQUIRE(sb.st_gid == 1000);
  };
  check(d);
  for (auto &e : fs::recursive_directory_iterator(d))
    check(e.path());

  auto again = volumes::repair_ownership({d}, 1000, 1000);
  REQUIRE(again.visited == 6);
  REQUIRE(again.changed == 0);
  check(d / "a" / "b" / "f2");
}

TEST_CASE("symlinks inside the tree are re-owned, not followed") {
  if (::geteuid() != 0)
    SKIP("needs root");
  auto d = mkd("innerlink");
  auto outside = mkd("innerlink_outside");
  touch(outside / "secret");
  REQUIRE(::lchown((outside / "secret").c_str(), 0, 0) == 0);
  fs::create_directories(d / "vol");
  fs::create_symlink(outside / "secret", d / "vol" / "secret");
  fs::create_directory_symlink(outside, d / "vol" / "outdir");

  volumes::repair_tree(d / "vol", 1000, 1000);

  REQUIRE(lst(d / "vol" / "secret").st_uid == 1000);
  REQUIRE(lst(d / "vol" / "outdir").st_uid == 1000);
  REQUIRE(lst(outside / "secret").st_uid == 0);
}
