/**
 * @file config_manager.cpp
 * @brief coordmap 配置管理器实现
 */

#include "coordmap/utility/config_manager.hpp"
#include "coordmap/common/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace coordmap {
namespace utility {

ConfigFileFormat detectConfigFormat(const std::string& file_path) {
    std::string extension = std::filesystem::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (extension == ".yaml" || extension == ".yml") {
        return ConfigFileFormat::YAML;
    }
    return ConfigFileFormat::JSON;
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfigs(const std::string& config_dir_path) {
    // 确保配置目录存在
    if (!std::filesystem::exists(config_dir_path)) {
        std::filesystem::create_directories(config_dir_path);
    }

    bool all_success = true;

    const std::vector<ConfigFileType> types = {
        ConfigFileType::CORE,
        ConfigFileType::REFERENCE,
        ConfigFileType::STATS
    };

    for (auto type : types) {
        const std::string stem = config_dir_path + "/" + configTypeToString(type);
        std::string filepath = stem + ".json";
        for (const char* extension : {".yaml", ".yml"}) {
            if (std::filesystem::exists(stem + extension)) {
                filepath = stem + extension;
                break;
            }
        }

        if (!loadConfig(type, filepath)) {
            all_success = false;
        }
    }

    return all_success;
}

bool ConfigManager::loadConfig(ConfigFileType type, const std::string& config_file_path) {
    return loadConfig(type, config_file_path, detectConfigFormat(config_file_path));
}

bool ConfigManager::loadConfig(ConfigFileType type, const std::string& config_file_path, ConfigFileFormat format) {
    try {
        config_file_paths_[type] = config_file_path;

        if (!std::filesystem::exists(config_file_path)) {
            // 如果文件不存在，创建默认配置文件
            auto default_config = getDefaultConfig(type);
            configs_[type] = default_config;
            bool saved = format == ConfigFileFormat::YAML
                ? saveYamlFile(default_config, config_file_path)
                : saveJsonFile(default_config, config_file_path);
            if (!saved) {
                std::cerr << "Failed to create default config file: " << config_file_path << std::endl;
            }
            return saved;
        }

        nlohmann::json config = format == ConfigFileFormat::YAML
            ? loadYamlFile(config_file_path)
            : loadJsonFile(config_file_path);

        // 合并默认配置和加载的配置
        configs_[type] = mergeConfigs(getDefaultConfig(type), config);

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading config file " << config_file_path << ": " << e.what() << std::endl;
        configs_[type] = getDefaultConfig(type);
        return false;
    }
}

void ConfigManager::reset() {
    configs_.clear();
    config_file_paths_.clear();
}

nlohmann::json ConfigManager::getComponentConfig(ConfigFileType config_type, const std::string& component_name) const {
    auto config = getConfig(config_type);

    // 配置结构：配置文件类型 -> 组件名
    std::string category = configTypeToString(config_type);

    if (config.contains(category) && config[category].contains(component_name)) {
        return config[category][component_name];
    }

    return nlohmann::json::object();
}

nlohmann::json ConfigManager::getConfig(ConfigFileType type) const {
    auto it = configs_.find(type);
    if (it != configs_.end()) {
        return it->second;
    }

    return getDefaultConfig(type);
}

void ConfigManager::setConfigValue(ConfigFileType type, const std::string& json_path, const nlohmann::json& value) {
    auto path_components = parseJsonPath(json_path);
    if (configs_.find(type) == configs_.end()) {
        configs_[type] = getDefaultConfig(type);
    }
    setValueByPath(configs_[type], path_components, value);
}

bool ConfigManager::saveConfig(ConfigFileType type, const std::string& config_file_path) const {
    std::string filepath = config_file_path;
    if (filepath.empty()) {
        auto it = config_file_paths_.find(type);
        if (it == config_file_paths_.end()) {
            return false;
        }
        filepath = it->second;
    }

    auto config = getConfig(type);
    if (detectConfigFormat(filepath) == ConfigFileFormat::YAML) {
        return saveYamlFile(config, filepath);
    }
    return saveJsonFile(config, filepath);
}

bool ConfigManager::validateConfigs() const {
    for (auto type : {ConfigFileType::CORE, ConfigFileType::REFERENCE, ConfigFileType::STATS}) {
        if (!validateConfig(type)) {
            return false;
        }
    }
    return true;
}

bool ConfigManager::validateConfig(ConfigFileType type) const {
    try {
        const auto config = getConfig(type);

        switch (type) {
            case ConfigFileType::CORE: {
                auto logger_config = getComponentConfig(type, "logger");
                if (logger_config.contains("max_file_size") && logger_config["max_file_size"].get<long long>() <= 0) {
                    return false;
                }
                if (logger_config.contains("max_files") && logger_config["max_files"].get<long long>() <= 0) {
                    return false;
                }
                if (logger_config.contains("level")) {
                    static const std::vector<std::string> levels = {
                        "trace", "debug", "info", "warn", "error", "critical", "off"};
                    auto level = logger_config["level"].get<std::string>();
                    if (std::find(levels.begin(), levels.end(), level) == levels.end()) {
                        return false;
                    }
                }
                break;
            }

            case ConfigFileType::REFERENCE: {
                auto affine_config = getComponentConfig(type, "affine");
                if (affine_config.contains("singular_threshold") &&
                    affine_config["singular_threshold"].get<double>() < 0.0) {
                    return false;
                }
                break;
            }

            case ConfigFileType::STATS: {
                auto pca_config = getComponentConfig(type, "pca");
                if (pca_config.contains("tol_ratio")) {
                    double tol_ratio = pca_config["tol_ratio"].get<double>();
                    if (tol_ratio < 0.0 || tol_ratio >= 1.0) {
                        return false;
                    }
                }
                break;
            }
        }
    } catch (const nlohmann::json::exception&) {
        // 类型不符
        return false;
    }

    return true;
}

nlohmann::json ConfigManager::getDefaultConfig(ConfigFileType type) {
    switch (type) {
        case ConfigFileType::CORE:
            return nlohmann::json::parse(R"({
                "core": {
                    "logger": {
                        "name": "coordmap",
                        "console_enabled": true,
                        "file_enabled": false,
                        "file_path": "logs/coordmap.log",
                        "max_file_size": 10485760,
                        "max_files": 5,
                        "async_enabled": false,
                        "level": "warn"
                    }
                }
            })");

        case ConfigFileType::REFERENCE:
            return nlohmann::json::parse(R"({
                "reference": {
                    "affine": {
                        "singular_threshold": 0.0
                    }
                }
            })");

        case ConfigFileType::STATS:
            return nlohmann::json::parse(R"({
                "stats": {
                    "pca": {
                        "tol_ratio": 0.01,
                        "standardize": true
                    }
                }
            })");

        default:
            return nlohmann::json::object();
    }
}

std::string ConfigManager::configTypeToString(ConfigFileType type) {
    switch (type) {
        case ConfigFileType::CORE: return "core";
        case ConfigFileType::REFERENCE: return "reference";
        case ConfigFileType::STATS: return "stats";
        default: return "unknown";
    }
}

ConfigFileType ConfigManager::stringToConfigType(const std::string& type_str) {
    if (type_str == "core") return ConfigFileType::CORE;
    if (type_str == "reference") return ConfigFileType::REFERENCE;
    if (type_str == "stats") return ConfigFileType::STATS;

    throw ConfigurationError("ConfigManager", "Unknown config type: " + type_str);
}

std::vector<std::string> ConfigManager::parseJsonPath(const std::string& json_path) const {
    std::vector<std::string> path_components;
    std::stringstream ss(json_path);
    std::string component;

    while (std::getline(ss, component, '.')) {
        if (!component.empty()) {
            path_components.push_back(component);
        }
    }

    return path_components;
}

nlohmann::json ConfigManager::getValueByPath(const nlohmann::json& json, const std::vector<std::string>& path) const {
    const nlohmann::json* current = &json;

    for (const auto& component : path) {
        if (!current->is_object() || !current->contains(component)) {
            return nlohmann::json();
        }
        current = &(*current)[component];
    }

    return *current;
}

void ConfigManager::setValueByPath(nlohmann::json& json, const std::vector<std::string>& path, const nlohmann::json& value) {
    if (path.empty()) {
        return;
    }

    nlohmann::json* current = &json;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (!current->contains(path[i]) || !(*current)[path[i]].is_object()) {
            (*current)[path[i]] = nlohmann::json::object();
        }
        current = &((*current)[path[i]]);
    }

    (*current)[path.back()] = value;
}

nlohmann::json ConfigManager::mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) const {
    nlohmann::json result = base;

    if (!overlay.is_object()) {
        return result;
    }

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it.value().is_object() && result.contains(it.key()) && result[it.key()].is_object()) {
            result[it.key()] = mergeConfigs(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }

    return result;
}

nlohmann::json ConfigManager::loadJsonFile(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("ConfigManager", "Failed to open config file: " + file_path);
    }

    nlohmann::json config;
    file >> config;
    return config;
}

nlohmann::json ConfigManager::loadYamlFile(const std::string& file_path) const {
    YAML::Node root = YAML::LoadFile(file_path);
    return yamlToJson(root);
}

bool ConfigManager::saveJsonFile(const nlohmann::json& config, const std::string& file_path) const {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return false;
    }

    file << config.dump(4);
    return file.good();
}

bool ConfigManager::saveYamlFile(const nlohmann::json& config, const std::string& file_path) const {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return false;
    }

    YAML::Emitter emitter;
    emitter << jsonToYaml(config);
    file << emitter.c_str() << "\n";
    return file.good();
}

nlohmann::json ConfigManager::yamlToJson(const YAML::Node& yaml_node) const {
    switch (yaml_node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json result = nlohmann::json::object();
            for (auto it = yaml_node.begin(); it != yaml_node.end(); ++it) {
                result[it->first.as<std::string>()] = yamlToJson(it->second);
            }
            return result;
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json result = nlohmann::json::array();
            for (const auto& element : yaml_node) {
                result.push_back(yamlToJson(element));
            }
            return result;
        }

        case YAML::NodeType::Scalar: {
            const std::string& scalar = yaml_node.Scalar();

            // 带引号的标量保持为字符串
            if (yaml_node.Tag() == "!") {
                return scalar;
            }
            if (scalar == "true") return true;
            if (scalar == "false") return false;

            try {
                size_t pos = 0;
                long long integer = std::stoll(scalar, &pos);
                if (pos == scalar.size()) {
                    return integer;
                }
                double number = std::stod(scalar, &pos);
                if (pos == scalar.size()) {
                    return number;
                }
            } catch (const std::logic_error&) {
                // 不是数值
            }
            return scalar;
        }

        default:
            return nullptr;
    }
}

YAML::Node ConfigManager::jsonToYaml(const nlohmann::json& json_obj) const {
    YAML::Node node;

    switch (json_obj.type()) {
        case nlohmann::json::value_t::object:
            node = YAML::Node(YAML::NodeType::Map);
            for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
                node[it.key()] = jsonToYaml(it.value());
            }
            break;

        case nlohmann::json::value_t::array:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& element : json_obj) {
                node.push_back(jsonToYaml(element));
            }
            break;

        case nlohmann::json::value_t::string:
            node = json_obj.get<std::string>();
            break;

        case nlohmann::json::value_t::boolean:
            node = json_obj.get<bool>();
            break;

        case nlohmann::json::value_t::number_integer:
            node = json_obj.get<long long>();
            break;

        case nlohmann::json::value_t::number_unsigned:
            node = json_obj.get<unsigned long long>();
            break;

        case nlohmann::json::value_t::number_float:
            node = json_obj.get<double>();
            break;

        default:
            node = YAML::Node(YAML::NodeType::Null);
            break;
    }

    return node;
}

} // namespace utility
} // namespace coordmap
