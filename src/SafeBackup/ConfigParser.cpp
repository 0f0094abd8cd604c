// =================================================================
// src/SafeBackup/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "SafeBackup/ConfigParser.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace SafeBackup {

namespace {

void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, std::string>& values) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key, values);
        }
    } else if (node.IsScalar() && !prefix.empty()) {
        values[prefix] = node.as<std::string>();
    } else if (!node.IsNull() && !prefix.empty()) {
        Logger::getInstance().warning("ConfigParser", "Ignoring non-scalar value", prefix);
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) : m_loaded(false) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        // A missing configuration simply means defaults
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        flatten(root, "", m_config_values);
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        throw BackupError(ErrorKind::INVALID_INPUT,
                          "Invalid configuration file " + config_path + ": " + e.what());
    }

    Logger::getInstance().debug("ConfigParser", "Loaded configuration", config_path);
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

bool ConfigParser::hasValue(const std::string& key) const {
    return m_config_values.find(key) != m_config_values.end();
}

} // namespace SafeBackup
