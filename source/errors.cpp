#include <privdrop/errors.hpp>

#include <fmt/format.h>

namespace privdrop {

const char *to_string(Phase p) {
  switch (p) {
  case Phase::Config:
    return "config";
  case Phase::EnsureDirectories:
    return "ensure-directories";
  case Phase::RepairOwnership:
    return "repair-ownership";
  case Phase::TransferIdentity:
    return "transfer-identity";
  case Phase::Exec:
    return "exec";
  }
  return "unknown";
}

static std::string with_code(const std::string &msg, const std::error_code &ec) {
  if (!ec)
    return msg;
  return fmt::format("{}: {}", msg, ec.message());
}

StartupError::StartupError(Phase phase, const std::string &msg,
                           std::error_code ec)
    : std::runtime_error(with_code(msg, ec)), phase_(phase), ec_(ec) {}

std::error_code errno_code(int err) {
  return std::error_code(err, std::generic_category());
}

} // namespace privdrop
