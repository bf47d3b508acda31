#include "xdgdirs/xdg.hpp"

namespace xdgdirs {

Dir config(const std::string& name) { return core::Resolver(name).config(); }
Dir cache(const std::string& name) { return core::Resolver(name).cache(); }
Dir data(const std::string& name) { return core::Resolver(name).data(); }
Dir state(const std::string& name) { return core::Resolver(name).state(); }
Dir runtime(const std::string& name) { return core::Resolver(name).runtime(); }

std::vector<Dir> configDirs(const std::string& name) {
  return core::Resolver(name).configDirs();
}

std::vector<Dir> dataDirs(const std::string& name) {
  return core::Resolver(name).dataDirs();
}

}  // namespace xdgdirs
