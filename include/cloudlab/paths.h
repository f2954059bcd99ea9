#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cloudlab {

// Layout of the CloudLab state directory. Owned by the management command; read-only here.
class Paths {
public:
  explicit Paths(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

  [[nodiscard]] std::filesystem::path config_file() const;
  [[nodiscard]] std::filesystem::path pid_dir() const;
  [[nodiscard]] std::filesystem::path pid_file(std::string_view service) const;
  [[nodiscard]] std::filesystem::path log_dir() const;
  [[nodiscard]] std::filesystem::path log_file(std::string_view service) const;
  [[nodiscard]] std::filesystem::path default_env_dir() const;
  [[nodiscard]] std::filesystem::path envs_dir() const;
  [[nodiscard]] std::filesystem::path dashboard_html() const;

  // True for names that stay inside their directory once joined: [A-Za-z0-9_.-]+ and not "." or "..".
  static bool is_plain_name(std::string_view name);

private:
  std::filesystem::path root_;
};

} // namespace cloudlab
