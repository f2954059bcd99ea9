#pragma once

#include "cloudlab/paths.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cloudlab {

struct EnvironmentDescriptor {
  std::string name;
  bool is_default = false;
  std::string path;

  [[nodiscard]] nlohmann::json to_json() const;
};

class EnvironmentCatalog {
public:
  static constexpr const char* kDefaultName = "cloudlab";

  explicit EnvironmentCatalog(const Paths& paths);

  // Default environment first (when <root>/venv is a directory), then every directory under
  // <root>/envs in enumeration order.
  std::vector<EnvironmentDescriptor> list() const;

private:
  const Paths& paths_;
};

nlohmann::json to_json(const std::vector<EnvironmentDescriptor>& envs);

} // namespace cloudlab
