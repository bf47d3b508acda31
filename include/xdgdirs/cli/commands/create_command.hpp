#pragma once

#include "xdgdirs/cli/application.hpp"

namespace xdgdirs::cli {

/**
 * @brief Create an application's single-path role directories
 *
 * Roles come from --role, or from create.roles in the config. Roles that do
 * not resolve in the current environment are skipped with a warning; the
 * first creation failure stops the command.
 */
class CreateCommand : public Command {
public:
  explicit CreateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  void setupCommand(CLI::App* cmd) override;

  std::string name() const override { return "create"; }
  std::string description() const override {
    return "Create the application's config, cache, data, state or runtime directories";
  }

private:
  Application& app_;

  std::string app_name_;
  std::vector<std::string> roles_;
};

} // namespace xdgdirs::cli
