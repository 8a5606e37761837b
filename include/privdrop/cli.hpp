#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace privdrop {

struct CmdHelp {};
struct CmdVersion {};
struct CmdCheck {};
struct CmdRun {
  std::vector<std::string> argv;
};

using Command = std::variant<CmdHelp, CmdVersion, CmdCheck, CmdRun>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

// Options are only recognised before the command; "--" ends them.
ParseResult parse_cli(int argc, char **argv);

} // namespace privdrop
