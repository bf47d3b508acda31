#pragma once

#include <string>
#include <vector>

#include "xdgdirs/core/dir.hpp"
#include "xdgdirs/core/resolver.hpp"

namespace xdgdirs {

using core::Dir;
using core::Role;

// One-call lookups against the live process environment.
// Each builds a fresh Resolver for name; see core::Resolver.
Dir config(const std::string& name);
Dir cache(const std::string& name);
Dir data(const std::string& name);
Dir state(const std::string& name);
Dir runtime(const std::string& name);
std::vector<Dir> configDirs(const std::string& name);
std::vector<Dir> dataDirs(const std::string& name);

}  // namespace xdgdirs
