#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace dualattn {
namespace core {

/**
 * @brief Configuration value type
 */
using ConfigValue = std::variant<std::string, int, double, bool>;

/**
 * @brief Flat key/value configuration backed by a JSON file
 *
 * Keys are dotted names ("attention.variant"). Nested JSON objects are
 * flattened on load, so {"attention": {"variant": "manual"}} and
 * {"attention.variant": "manual"} are equivalent.
 */
class ConfigManager {
public:
    /**
     * @brief Construct with the default attention and log settings
     */
    ConfigManager();
    ~ConfigManager() = default;

    /**
     * @brief Load configuration file, merging it over the current values
     * @param config_path Configuration file path
     * @return true on success; false if the file is missing or not valid JSON
     */
    bool loadConfig(const std::string& config_path);

    /**
     * @brief Save configuration to file
     * @param config_path Target path; empty means the last loaded path
     * @return true on success
     */
    bool saveConfig(const std::string& config_path = "") const;

    std::string getString(const std::string& key, const std::string& default_value = "") const;
    int getInt(const std::string& key, int default_value = 0) const;

    /**
     * @brief Get floating point value; integer entries are widened
     */
    double getDouble(const std::string& key, double default_value = 0.0) const;
    bool getBool(const std::string& key, bool default_value = false) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;
    bool removeKey(const std::string& key);

    /**
     * @brief Restore the built-in defaults, dropping every other key
     */
    void resetToDefaults();

    std::string getConfigPath() const;

private:
    void createDefaultConfig();
    bool saveConfigInternal(const std::string& config_path) const;

private:
    std::unordered_map<std::string, ConfigValue> config_map_;  ///< Configuration entries
    std::string config_file_path_;                             ///< Last loaded or saved path
    mutable std::mutex mutex_;                                 ///< Guards all members
};

} // namespace core
} // namespace dualattn
