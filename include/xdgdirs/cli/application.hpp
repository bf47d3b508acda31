#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "xdgdirs/common.hpp"
#include "xdgdirs/core/environment.hpp"
#include "xdgdirs/core/resolver.hpp"
#include "xdgdirs/settings/config.hpp"

namespace xdgdirs::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Debug logging
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

// Parse --role values; an empty list selects every role
Result<std::vector<core::Role>> parseRoleNames(const std::vector<std::string>& names);

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  explicit Application(std::shared_ptr<const core::Environment> env);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;
  const settings::Config& config() const;

  // Application name from the command line, falling back to default_app
  Result<std::string> resolveAppName(const std::string& requested) const;

  // Resolver bound to app_name over this application's environment
  core::Resolver resolver(const std::string& app_name) const;

  // True when --json was given or the config selects JSON output
  bool jsonOutput() const;

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  // Load configuration and configure logging
  Result<void> initialize();

  void printError(const Error& error) const;

  CLI::App app_;
  GlobalOptions global_options_;
  settings::Config config_;
  std::shared_ptr<const core::Environment> env_;
  bool initialized_;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace xdgdirs::cli
