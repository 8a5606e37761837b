#include <privdrop/entrypoint.hpp>
#include <privdrop/errors.hpp>
#include <privdrop/identity.hpp>
#include <privdrop/process.hpp>
#include <privdrop/volumes.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace privdrop {

const char *to_string(Stage s) {
  switch (s) {
  case Stage::Start:
    return "start";
  case Stage::DirectoriesEnsured:
    return "directories-ensured";
  case Stage::OwnershipRepaired:
    return "ownership-repaired";
  case Stage::Executing:
    return "executing";
  case Stage::Failed:
    return "failed";
  }
  return "unknown";
}

Entrypoint::Entrypoint(Config cfg) : cfg_(std::move(cfg)) {}

void Entrypoint::require(Stage expected, const char *step) const {
  if (stage_ != expected)
    throw std::logic_error(fmt::format("{} called in stage {}, expected {}", step,
                                       to_string(stage_), to_string(expected)));
}

void Entrypoint::ensure_directories() {
  require(Stage::Start, "ensure_directories");
  try {
    volumes::ensure_directories(cfg_.directories);
  } catch (const StartupError &) {
    stage_ = Stage::Failed;
    throw;
  }
  stage_ = Stage::DirectoriesEnsured;
}

void Entrypoint::repair_ownership() {
  require(Stage::DirectoriesEnsured, "repair_ownership");
  spdlog::info("[chown] repairing ownership of mounted volumes");
  try {
    volumes::repair_ownership(cfg_.directories, cfg_.principal.uid,
                              cfg_.principal.gid);
  } catch (const StartupError &) {
    stage_ = Stage::Failed;
    throw;
  }
  stage_ = Stage::OwnershipRepaired;
}

void Entrypoint::transfer_and_exec(const std::vector<std::string> &cmd) {
  require(Stage::OwnershipRepaired, "transfer_and_exec");
  try {
    Account a = resolve_account(cfg_.principal);
    drop_privileges(a);
    spdlog::info("[exec] starting application as {}", a.name);
    stage_ = Stage::Executing;
    exec_replace(cmd);
  } catch (const StartupError &) {
    stage_ = Stage::Failed;
    throw;
  }
}

int Entrypoint::run(const std::vector<std::string> &cmd) {
  try {
    ensure_directories();
    repair_ownership();
    transfer_and_exec(cmd);
  } catch (const StartupError &e) {
    spdlog::error("{} failed: {}", to_string(e.phase()), e.what());
    spdlog::default_logger()->flush();
    return 1;
  }
}

} // namespace privdrop
