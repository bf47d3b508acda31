#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace xdgdirs::core {

/**
 * @brief Read-only view of the variables the resolver consults
 *
 * lookup() distinguishes an unset variable (std::nullopt) from one set to
 * the empty string.
 */
class Environment {
 public:
  virtual ~Environment() = default;

  // Value of a variable, or std::nullopt when unset
  virtual std::optional<std::string> lookup(std::string_view name) const = 0;

  // The user's home directory, or std::nullopt when it cannot be determined
  virtual std::optional<std::string> homeDirectory() const;
};

// Live process environment, read at every call
class ProcessEnvironment : public Environment {
 public:
  std::optional<std::string> lookup(std::string_view name) const override;

  // Shared instance; stateless, so safe to use from any thread
  static std::shared_ptr<const Environment> instance();
};

// Fixed set of variables, for tests and callers that resolve against a snapshot
class MapEnvironment : public Environment {
 public:
  using Variables = std::map<std::string, std::string, std::less<>>;

  MapEnvironment() = default;
  explicit MapEnvironment(Variables variables)
      : variables_(std::move(variables)) {}

  std::optional<std::string> lookup(std::string_view name) const override;

  // Copy with one variable set
  MapEnvironment with(std::string name, std::string value) const;

  // Copy with one variable removed
  MapEnvironment without(std::string_view name) const;

 private:
  Variables variables_;
};

}  // namespace xdgdirs::core
