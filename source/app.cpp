#include <privdrop/app.hpp>
#include <privdrop/cli.hpp>
#include <privdrop/config.hpp>
#include <privdrop/entrypoint.hpp>
#include <privdrop/errors.hpp>
#include <privdrop/identity.hpp>
#include <privdrop/logging.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

#ifndef PRIVDROP_VERSION
#define PRIVDROP_VERSION "unknown"
#endif

namespace privdrop {

static const char *usage_text() {
  return R"(privdrop - repair volume ownership, drop root, exec the application

Usage:
  privdrop [--] <executable> [args...]
  privdrop --check
  privdrop --version
  privdrop --help

Environment:
  PRIVDROP_LOG_LEVEL   trace|debug|info|warn|error|critical|off (default info)
)";
}

static std::string describe(const Config &cfg) {
  std::string dirs;
  for (const auto &d : cfg.directories) {
    if (!dirs.empty())
      dirs += ' ';
    dirs += d.string();
  }
  return fmt::format("user={} uid={} gid={} directories=[{}] monitor_port={}",
                     cfg.principal.user, cfg.principal.uid, cfg.principal.gid,
                     dirs, cfg.monitor_port);
}

int App::run(int argc, char **argv) {
  init_logging();

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    std::cerr << usage_text();
    return 2;
  }

  if (std::holds_alternative<CmdHelp>(*pr.cmd)) {
    std::cout << usage_text();
    return 0;
  }

  if (std::holds_alternative<CmdVersion>(*pr.cmd))
    std::cout << fmt::format("privdrop {}\n", PRIVDROP_VERSION);

  Config cfg;
  try {
    cfg = Config::builtin();
    if (std::holds_alternative<CmdVersion>(*pr.cmd)) {
      std::cout << describe(cfg) << "\n";
      return 0;
    }
    cfg.validate();
  } catch (const ConfigError &e) {
    spdlog::error("{} failed: {}", to_string(e.phase()), e.what());
    return 1;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdCheck>) {
          spdlog::info("[config] {}", describe(cfg));
          try {
            Account a = resolve_account(cfg.principal);
            spdlog::info("[identity] {} resolves to {}:{} home={}", a.name,
                         a.uid, a.gid, a.home);
          } catch (const IdentityTransferError &e) {
            spdlog::error("{} failed: {}", to_string(e.phase()), e.what());
            return 1;
          }
          return 0;

        } else if constexpr (std::is_same_v<T, CmdRun>) {
          spdlog::debug("[config] {}", describe(cfg));
          spdlog::debug("[config] port {} is reserved for the application's monitoring endpoint",
                        cfg.monitor_port);
          return Entrypoint(cfg).run(c.argv);

        } else {
          return 0;
        }
      },
      *pr.cmd);
}

} // namespace privdrop
