#include "cloudlab/paths.h"

#include <cctype>

namespace cloudlab {

Paths::Paths(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path Paths::config_file() const {
  return root_ / "config.json";
}

std::filesystem::path Paths::pid_dir() const {
  return root_ / "pids";
}

std::filesystem::path Paths::pid_file(std::string_view service) const {
  return pid_dir() / (std::string(service) + ".pid");
}

std::filesystem::path Paths::log_dir() const {
  return root_ / "logs";
}

std::filesystem::path Paths::log_file(std::string_view service) const {
  return log_dir() / (std::string(service) + ".log");
}

std::filesystem::path Paths::default_env_dir() const {
  return root_ / "venv";
}

std::filesystem::path Paths::envs_dir() const {
  return root_ / "envs";
}

std::filesystem::path Paths::dashboard_html() const {
  return root_ / "dashboard.html";
}

bool Paths::is_plain_name(std::string_view name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

} // namespace cloudlab
