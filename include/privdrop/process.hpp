#pragma once
#include <string>
#include <vector>

namespace privdrop {

// Replaces the current process image with argv[0] (looked up in PATH),
// keeping pid, open descriptors and environment. Never returns; throws
// ExecError if the image cannot be replaced.
[[noreturn]] void exec_replace(const std::vector<std::string> &argv);

} // namespace privdrop
