#include "xdgdirs/core/environment.hpp"

#include <cstdlib>

namespace xdgdirs::core {

std::optional<std::string> Environment::homeDirectory() const {
  auto home = lookup("HOME");
  if (!home || home->empty()) {
    return std::nullopt;
  }
  return home;
}

std::optional<std::string> ProcessEnvironment::lookup(std::string_view name) const {
  const char* value = std::getenv(std::string(name).c_str());
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

std::shared_ptr<const Environment> ProcessEnvironment::instance() {
  static const auto instance_ = std::make_shared<const ProcessEnvironment>();
  return instance_;
}

std::optional<std::string> MapEnvironment::lookup(std::string_view name) const {
  auto it = variables_.find(name);
  if (it == variables_.end()) {
    return std::nullopt;
  }
  return it->second;
}

MapEnvironment MapEnvironment::with(std::string name, std::string value) const {
  auto copy = variables_;
  copy.insert_or_assign(std::move(name), std::move(value));
  return MapEnvironment(std::move(copy));
}

MapEnvironment MapEnvironment::without(std::string_view name) const {
  auto copy = variables_;
  if (auto it = copy.find(name); it != copy.end()) {
    copy.erase(it);
  }
  return MapEnvironment(std::move(copy));
}

}  // namespace xdgdirs::core
