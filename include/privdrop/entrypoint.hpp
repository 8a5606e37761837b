#pragma once
#include <privdrop/config.hpp>

#include <string>
#include <vector>

namespace privdrop {

// Start -> DirectoriesEnsured -> OwnershipRepaired -> Executing,
// or Failed from any step. No other transitions.
enum class Stage { Start, DirectoriesEnsured, OwnershipRepaired, Executing, Failed };

const char *to_string(Stage s);

class Entrypoint {
public:
  explicit Entrypoint(Config cfg);

  const Config &config() const { return cfg_; }
  Stage stage() const { return stage_; }

  // Each step requires the previous stage and throws a StartupError
  // (moving to Failed) when it cannot complete. Calling a step out of
  // order is a logic_error.
  void ensure_directories();
  void repair_ownership();
  [[noreturn]] void transfer_and_exec(const std::vector<std::string> &cmd);

  // Drives every step. Returns 1 after logging the failed phase; on
  // success the process image is replaced and this never returns.
  int run(const std::vector<std::string> &cmd);

private:
  void require(Stage expected, const char *step) const;

  Config cfg_;
  Stage stage_{Stage::Start};
};

} // namespace privdrop
