#include "cloudlab/config_store.h"
#include "cloudlab/logger.h"

#include <fstream>
#include <iterator>

namespace cloudlab {

Configuration::Configuration(nlohmann::json raw) : raw_(std::move(raw)) {
    if (!raw_.is_object()) {
        raw_ = nlohmann::json::object();
    }
}

int Configuration::port(std::string_view key, int fallback) const {
    auto it = raw_.find(std::string(key));
    if (it == raw_.end() || !it->is_number_integer()) {
        return fallback;
    }
    auto value = it->get<int64_t>();
    if (value < 1 || value > 65535) {
        return fallback;
    }
    return static_cast<int>(value);
}

nlohmann::json Configuration::tunnel_urls() const {
    auto it = raw_.find("tunnel_urls");
    if (it == raw_.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

ConfigStore::ConfigStore(std::string path, Logger* logger)
    : path_(std::move(path)), logger_(logger) {}

Configuration ConfigStore::load() const {
    std::ifstream file(path_);
    if (!file) {
        if (logger_) {
            logger_->debug("config not found at " + path_ + ", using defaults");
        }
        return Configuration{};
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        if (logger_) {
            logger_->warn("failed to read config " + path_ + ", using defaults");
        }
        return Configuration{};
    }

    // Non-throwing parse: a discarded value signals a syntax error.
    nlohmann::json parsed = nlohmann::json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        if (logger_) {
            logger_->warn("config " + path_ + " is not valid JSON, using defaults");
        }
        return Configuration{};
    }
    if (!parsed.is_object()) {
        if (logger_) {
            logger_->warn("config " + path_ + " is not a JSON object, using defaults");
        }
        return Configuration{};
    }

    return Configuration(std::move(parsed));
}

} // namespace cloudlab
