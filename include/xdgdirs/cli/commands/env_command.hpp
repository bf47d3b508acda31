#pragma once

#include "xdgdirs/cli/application.hpp"

namespace xdgdirs::cli {

// Print shell assignments (XDG_CONFIG_HOME='...') for every role that resolves
class EnvCommand : public Command {
public:
  explicit EnvCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  void setupCommand(CLI::App* cmd) override;

  std::string name() const override { return "env"; }
  std::string description() const override {
    return "Print the application's directories as shell variable assignments";
  }

private:
  Application& app_;

  std::string app_name_;
  bool export_ = false;
};

// Quote a value for POSIX shells
std::string shellQuote(const std::string& value);

} // namespace xdgdirs::cli
