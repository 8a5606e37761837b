#pragma once
#include <privdrop/config.hpp>

#include <string>

#include <sys/types.h>

namespace privdrop {

// A principal as found in the local user database.
struct Account {
  std::string name;
  uid_t uid{0};
  gid_t gid{0};
  std::string home;
};

// Looks the principal up by name and checks it matches the configured ids.
// Throws IdentityTransferError.
Account resolve_account(const Principal &p);

// Replaces supplementary groups, gid and uid (real, effective, saved) with
// the account's and verifies the change cannot be undone.
// Throws IdentityTransferError.
void drop_privileges(const Account &a);

// True when real, effective and saved ids already equal the account's.
bool running_as(const Account &a);

} // namespace privdrop
