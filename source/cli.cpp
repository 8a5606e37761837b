#include <privdrop/cli.hpp>

#include <string_view>

namespace privdrop {

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  bool check = false;

  int i = 1;
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--") {
      ++i;
      break;
    }
    if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    if (a == "--check") {
      check = true;
      continue;
    }
    if (a.size() > 1 && a[0] == '-') {
      r.error = "unknown option: " + std::string(a);
      return r;
    }
    break;
  }

  if (check) {
    if (i < argc) {
      r.error = "--check does not take a command";
      return r;
    }
    r.cmd = CmdCheck{};
    return r;
  }
  if (i >= argc) {
    r.error = "command required";
    return r;
  }

  CmdRun c;
  c.argv.assign(argv + i, argv + argc);
  r.cmd = std::move(c);
  return r;
}

} // namespace privdrop
