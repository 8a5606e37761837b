#include <privdrop/errors.hpp>
#include <privdrop/identity.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <grp.h>
#include <pwd.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace privdrop {

Account resolve_account(const Principal &p) {
  errno = 0;
  struct passwd *pw = ::getpwnam(p.user.c_str());
  if (!pw) {
    if (errno != 0)
      throw IdentityTransferError(fmt::format("lookup of user {}", p.user),
                                  errno_code(errno));
    throw IdentityTransferError(
        fmt::format("user {} not found in the user database", p.user));
  }

  Account a{pw->pw_name, pw->pw_uid, pw->pw_gid,
            pw->pw_dir ? pw->pw_dir : ""};
  if (a.uid != p.uid || a.gid != p.gid)
    throw IdentityTransferError(
        fmt::format("user {} is {}:{} in the user database, expected {}:{}",
                    a.name, a.uid, a.gid, p.uid, p.gid));
  return a;
}

bool running_as(const Account &a) {
  uid_t ruid, euid, suid;
  gid_t rgid, egid, sgid;
  if (::getresuid(&ruid, &euid, &suid) != 0 ||
      ::getresgid(&rgid, &egid, &sgid) != 0)
    return false;
  return ruid == a.uid && euid == a.uid && suid == a.uid && rgid == a.gid &&
         egid == a.gid && sgid == a.gid;
}

void drop_privileges(const Account &a) {
  if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0)
    throw IdentityTransferError("prctl(PR_SET_NO_NEW_PRIVS)", errno_code(errno));

  if (::geteuid() != 0) {
    if (running_as(a)) {
      spdlog::warn("[identity] not started as root; already running as {} ({}:{})",
                   a.name, a.uid, a.gid);
      return;
    }
    throw IdentityTransferError(
        fmt::format("not started as root (euid={}), cannot switch to {}",
                    ::geteuid(), a.name),
        errno_code(EPERM));
  }

  // groups first: setgroups needs CAP_SETGID which setresuid takes away
  if (::initgroups(a.name.c_str(), a.gid) != 0)
    throw IdentityTransferError(
        fmt::format("initgroups({}, {})", a.name, a.gid), errno_code(errno));
  if (::setresgid(a.gid, a.gid, a.gid) != 0)
    throw IdentityTransferError(fmt::format("setresgid({})", a.gid),
                                errno_code(errno));
  if (::setresuid(a.uid, a.uid, a.uid) != 0)
    throw IdentityTransferError(fmt::format("setresuid({})", a.uid),
                                errno_code(errno));

  if (!running_as(a))
    throw IdentityTransferError(
        fmt::format("credentials of {} not fully applied", a.name));
  if (a.uid != 0 && ::setuid(0) == 0)
    throw IdentityTransferError("uid 0 still reachable after drop");

  spdlog::info("[identity] now running as {} ({}:{})", a.name, a.uid, a.gid);
}

} // namespace privdrop
