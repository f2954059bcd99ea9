#include "cloudlab/environments.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace cloudlab {

nlohmann::json EnvironmentDescriptor::to_json() const {
  return nlohmann::json{{"name", name}, {"default", is_default}, {"path", path}};
}

nlohmann::json to_json(const std::vector<EnvironmentDescriptor>& envs) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& env : envs) {
    arr.push_back(env.to_json());
  }
  return arr;
}

EnvironmentCatalog::EnvironmentCatalog(const Paths& paths) : paths_(paths) {}

std::vector<EnvironmentDescriptor> EnvironmentCatalog::list() const {
  std::vector<EnvironmentDescriptor> envs;
  std::error_code ec;

  fs::path venv = paths_.default_env_dir();
  if (fs::is_directory(venv, ec)) {
    envs.push_back({kDefaultName, true, venv.string()});
  }

  fs::path envs_dir = paths_.envs_dir();
  ec.clear();
  fs::directory_iterator it(envs_dir, ec);
  if (ec) {
    return envs;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    // Follows symlinks, so a link to an environment directory counts.
    if (!it->is_directory(type_ec)) {
      continue;
    }
    envs.push_back({it->path().filename().string(), false, it->path().string()});
  }

  return envs;
}

} // namespace cloudlab
