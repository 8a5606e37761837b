#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace privdrop {

enum class Phase { Config, EnsureDirectories, RepairOwnership, TransferIdentity, Exec };

const char *to_string(Phase p);

// Base of every fatal startup failure. what() carries the message only;
// the driver prefixes it with the phase name.
class StartupError : public std::runtime_error {
public:
  StartupError(Phase phase, const std::string &msg,
               std::error_code ec = std::error_code{});

  Phase phase() const { return phase_; }
  const std::error_code &code() const { return ec_; }

private:
  Phase phase_;
  std::error_code ec_;
};

struct ConfigError : StartupError {
  explicit ConfigError(const std::string &msg)
      : StartupError(Phase::Config, msg) {}
};

struct DirectoryCreationError : StartupError {
  DirectoryCreationError(const std::string &msg, std::error_code ec)
      : StartupError(Phase::EnsureDirectories, msg, ec) {}
};

struct OwnershipRepairError : StartupError {
  OwnershipRepairError(const std::string &msg, std::error_code ec)
      : StartupError(Phase::RepairOwnership, msg, ec) {}
};

struct IdentityTransferError : StartupError {
  IdentityTransferError(const std::string &msg,
                        std::error_code ec = std::error_code{})
      : StartupError(Phase::TransferIdentity, msg, ec) {}
};

struct ExecError : StartupError {
  ExecError(const std::string &msg, std::error_code ec)
      : StartupError(Phase::Exec, msg, ec) {}
};

// errno -> std::error_code in the generic category
std::error_code errno_code(int err);

} // namespace privdrop
