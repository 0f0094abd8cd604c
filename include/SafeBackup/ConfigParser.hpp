// =================================================================
// include/SafeBackup/ConfigParser.hpp
// =================================================================
// Defines a parser for the .safe_backup/config.yml file.

#pragma once

#include <string>
#include <map>

namespace SafeBackup {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     *
     * Nested mappings are flattened into dotted keys, so
     * "logging: { level: debug }" is read back as "logging.level".
     * A missing file yields an empty configuration.
     *
     * @param config_path The path to the config.yml file.
     * @throws BackupError INVALID_INPUT if the file is not valid YAML.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a string value for a given key.
     * @param key The configuration key (e.g., "activity_log").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    bool hasValue(const std::string& key) const;

    /**
     * @brief Whether a configuration file was found and read.
     */
    bool isLoaded() const { return m_loaded; }

private:
    std::map<std::string, std::string> m_config_values;
    bool m_loaded;
};

} // namespace SafeBackup
