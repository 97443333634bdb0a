/**
 * @file config_manager.hpp
 * @brief coordmap 配置管理器
 *
 * @details 配置管理系统设计
 *
 * 1. 核心功能
 *    - 配置文件读取：支持 JSON 与 YAML 两种格式，按扩展名自动检测
 *    - 统一配置接口：所有配置在内存中以 nlohmann::json 表示
 *    - 默认值合并：文件中的配置覆盖内置默认配置
 *    - 参数验证：确保配置参数的有效性
 *
 * 2. 配置文件分类
 *    - core:      日志等全局设置
 *    - reference: 坐标映射相关数值参数（奇异矩阵判定阈值等）
 *    - stats:     主成分分析默认参数
 *
 * 3. 使用方法
 *    @code
 *    ConfigManager::getInstance().loadConfigs("config/");
 *
 *    auto logger_config = ConfigManager::getInstance().getComponentConfig(ConfigFileType::CORE, "logger");
 *    double tol = ConfigManager::getInstance().getConfigValue<double>(
 *        ConfigFileType::STATS, "stats.pca.tol_ratio", 0.01);
 *    @endcode
 */
#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordmap {
namespace utility {

/**
 * @brief 配置文件类型枚举
 */
enum class ConfigFileType {
    CORE,       // 核心配置（日志）
    REFERENCE,  // 坐标映射
    STATS       // 统计
};

/**
 * @brief 配置文件格式枚举
 */
enum class ConfigFileFormat {
    JSON,
    YAML
};

/**
 * @brief 按扩展名检测配置文件格式（.yaml/.yml 为 YAML，其余为 JSON）
 */
ConfigFileFormat detectConfigFormat(const std::string& file_path);

/**
 * @brief 配置管理器类
 *
 * 采用单例模式。加载完成后的只读访问可以在多个线程中并发进行。
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief 加载目录下所有类型的配置文件
     *
     * 每种类型依次查找 <type>.yaml、<type>.yml、<type>.json，
     * 都不存在时写出默认的 <type>.json。
     *
     * @param config_dir_path 配置文件目录路径
     * @return bool 所有文件是否加载成功
     */
    bool loadConfigs(const std::string& config_dir_path);

    /**
     * @brief 加载单个配置文件（自动检测格式）
     */
    bool loadConfig(ConfigFileType type, const std::string& config_file_path);

    /**
     * @brief 加载单个配置文件（指定格式）
     * @return bool 加载是否成功；失败时该类型回退到默认配置
     */
    bool loadConfig(ConfigFileType type, const std::string& config_file_path, ConfigFileFormat format);

    /**
     * @brief 丢弃已加载的配置，恢复默认值
     */
    void reset();

    /**
     * @brief 获取组件配置，即 config[<type>][component_name]
     * @return nlohmann::json 不存在时为空对象
     */
    nlohmann::json getComponentConfig(ConfigFileType config_type, const std::string& component_name) const;

    /**
     * @brief 获取指定类型的完整配置
     */
    nlohmann::json getConfig(ConfigFileType type) const;

    /**
     * @brief 获取指定路径的配置值
     * @tparam T 返回值类型
     * @param type 配置文件类型
     * @param json_path 点分隔路径（如 "stats.pca.tol_ratio"）
     * @param default_value 默认值（路径不存在或类型不符时返回）
     */
    template<typename T>
    T getConfigValue(ConfigFileType type, const std::string& json_path, const T& default_value) const;

    /**
     * @brief 设置配置值
     */
    void setConfigValue(ConfigFileType type, const std::string& json_path, const nlohmann::json& value);

    /**
     * @brief 保存指定类型的配置到文件，格式由扩展名决定
     * @param config_file_path 文件路径，为空时使用加载时的路径
     */
    bool saveConfig(ConfigFileType type, const std::string& config_file_path = "") const;

    bool validateConfigs() const;

    bool validateConfig(ConfigFileType type) const;

    static nlohmann::json getDefaultConfig(ConfigFileType type);

    static std::string configTypeToString(ConfigFileType type);

    /**
     * @throw ConfigurationError 未知类型字符串
     */
    static ConfigFileType stringToConfigType(const std::string& type_str);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::vector<std::string> parseJsonPath(const std::string& json_path) const;

    nlohmann::json getValueByPath(const nlohmann::json& json, const std::vector<std::string>& path) const;

    void setValueByPath(nlohmann::json& json, const std::vector<std::string>& path, const nlohmann::json& value);

    /**
     * @brief 递归合并，overlay 中的值覆盖 base
     */
    nlohmann::json mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) const;

    nlohmann::json loadJsonFile(const std::string& file_path) const;

    nlohmann::json loadYamlFile(const std::string& file_path) const;

    bool saveJsonFile(const nlohmann::json& config, const std::string& file_path) const;

    bool saveYamlFile(const nlohmann::json& config, const std::string& file_path) const;

    nlohmann::json yamlToJson(const YAML::Node& yaml_node) const;

    YAML::Node jsonToYaml(const nlohmann::json& json_obj) const;

    std::unordered_map<ConfigFileType, nlohmann::json> configs_;             ///< 配置存储
    std::unordered_map<ConfigFileType, std::string> config_file_paths_;      ///< 配置文件路径
};

// 模板方法实现
template<typename T>
T ConfigManager::getConfigValue(ConfigFileType type, const std::string& json_path, const T& default_value) const {
    try {
        auto config = getConfig(type);
        auto value = getValueByPath(config, parseJsonPath(json_path));

        if (value.is_null()) {
            return default_value;
        }

        return value.get<T>();
    } catch (const nlohmann::json::exception&) {
        return default_value;
    }
}

} // namespace utility
} // namespace coordmap
