#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace cloudlab {

class Logger;

// Snapshot of <root>/config.json. Every accessor falls back to a default.
class Configuration {
public:
  Configuration() = default;
  explicit Configuration(nlohmann::json raw);

  [[nodiscard]] const nlohmann::json& raw() const noexcept { return raw_; }
  [[nodiscard]] bool empty() const noexcept { return raw_.empty(); }

  // Value of `key` when it is an integer in [1, 65535], otherwise `fallback`.
  [[nodiscard]] int port(std::string_view key, int fallback) const;

  // The `tunnel_urls` object, or {} when missing or not an object.
  [[nodiscard]] nlohmann::json tunnel_urls() const;

private:
  nlohmann::json raw_ = nlohmann::json::object();
};

class ConfigStore {
public:
  explicit ConfigStore(std::string path, Logger* logger = nullptr);

  // Reads the file on every call; missing or corrupt files give an empty configuration.
  Configuration load() const;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  Logger* logger_;
};

} // namespace cloudlab
