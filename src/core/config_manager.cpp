#include "config_manager.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace dualattn {
namespace core {

namespace {

// Flatten nested objects into dotted keys; arrays and nulls are skipped
void flattenInto(const json& node, const std::string& prefix,
                 std::unordered_map<std::string, ConfigValue>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const json& value = it.value();
        if (value.is_object()) {
            flattenInto(value, key, out);
        } else if (value.is_string()) {
            out[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            out[key] = value.get<bool>();
        } else if (value.is_number_integer()) {
            out[key] = value.get<int>();
        } else if (value.is_number_float()) {
            out[key] = value.get<double>();
        } else {
            Logger::getInstance().warning("ConfigManager: ignoring unsupported value for key '" +
                                          key + "'");
        }
    }
}

} // namespace

ConfigManager::ConfigManager() {
    createDefaultConfig();
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        Logger::getInstance().error("Cannot open config file: " + config_path);
        return false;
    }

    json root = json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        Logger::getInstance().error("Failed to parse config file: " + config_path);
        return false;
    }

    std::unordered_map<std::string, ConfigValue> loaded;
    flattenInto(root, "", loaded);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : loaded) {
        config_map_[entry.first] = std::move(entry.second);
    }
    config_file_path_ = config_path;
    Logger::getInstance().debug("Config loaded from: " + config_path);
    return true;
}

bool ConfigManager::saveConfig(const std::string& config_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveConfigInternal(config_path);
}

bool ConfigManager::saveConfigInternal(const std::string& config_path) const {
    const std::string path = config_path.empty() ? config_file_path_ : config_path;
    if (path.empty()) {
        Logger::getInstance().error("No config file path specified");
        return false;
    }

    try {
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        json root = json::object();
        for (const auto& pair : config_map_) {
            std::visit([&root, &pair](const auto& value) { root[pair.first] = value; },
                       pair.second);
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::getInstance().error("Cannot create config file: " + path);
            return false;
        }
        file << root.dump(2) << '\n';
        if (!file.good()) {
            Logger::getInstance().error("Failed writing config file: " + path);
            return false;
        }
        Logger::getInstance().debug("Config saved to: " + path);
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().error(std::string("Error saving config: ") + e.what());
        return false;
    }
}

std::string ConfigManager::getString(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = config_map_.find(key);
    if (it != config_map_.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return default_value;
}

int ConfigManager::getInt(const std::string& key, int default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = config_map_.find(key);
    if (it != config_map_.end() && std::holds_alternative<int>(it->second)) {
        return std::get<int>(it->second);
    }
    return default_value;
}

double ConfigManager::getDouble(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = config_map_.find(key);
    if (it != config_map_.end()) {
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int>(it->second)) {
            return static_cast<double>(std::get<int>(it->second));
        }
    }
    return default_value;
}

bool ConfigManager::getBool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = config_map_.find(key);
    if (it != config_map_.end() && std::holds_alternative<bool>(it->second)) {
        return std::get<bool>(it->second);
    }
    return default_value;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_map_[key] = value;
}

void ConfigManager::setInt(const std::string& key, int value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_map_[key] = value;
}

void ConfigManager::setDouble(const std::string& key, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_map_[key] = value;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_map_[key] = value;
}

bool ConfigManager::hasKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_map_.find(key) != config_map_.end();
}

bool ConfigManager::removeKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_map_.erase(key) > 0;
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_map_.clear();
    createDefaultConfig();
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_file_path_;
}

void ConfigManager::createDefaultConfig() {
    // Attention operator selection
    config_map_["attention.variant"] = std::string("dispatch");
    config_map_["attention.fast_path"] = std::string("ggml");
    config_map_["attention.num_threads"] = 0; // 0 means auto-detect
    config_map_["attention.dropout_seed"] = 42;

    // Log settings
    config_map_["log.level"] = std::string("INFO");
    config_map_["log.console_output"] = true;
    config_map_["log.file"] = std::string("");
}

} // namespace core
} // namespace dualattn
