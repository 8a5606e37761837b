#include <privdrop/errors.hpp>
#include <privdrop/process.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <unistd.h>

namespace privdrop {

void exec_replace(const std::vector<std::string> &args) {
  if (args.empty() || args.front().empty())
    throw ExecError("empty command", errno_code(ENOENT));

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  spdlog::info("[exec] {}", fmt::join(args, " "));
  spdlog::default_logger()->flush();

  ::execvp(argv[0], argv.data());

  int err = errno;
  throw ExecError(fmt::format("cannot execute {}", args.front()), errno_code(err));
}

} // namespace privdrop
