#pragma once

#include "xdgdirs/cli/application.hpp"

namespace xdgdirs::cli {

/**
 * @brief Print the resolved directories of an application
 *
 * Text output is one "role<TAB>path" line per role; search-path roles are
 * joined with ':'. JSON output is an object keyed by role name.
 */
class ShowCommand : public Command {
public:
  explicit ShowCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  void setupCommand(CLI::App* cmd) override;

  std::string name() const override { return "show"; }
  std::string description() const override {
    return "Show resolved XDG directories for an application";
  }

private:
  Application& app_;

  std::string app_name_;
  std::vector<std::string> roles_;
};

} // namespace xdgdirs::cli
