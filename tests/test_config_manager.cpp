/**
 * @file test_config_manager.cpp
 * @brief ConfigManager 与 SimpleLogger 单元测试
 */

#include <gtest/gtest.h>
#include "coordmap/utility/config_manager.hpp"
#include "coordmap/utility/simple_logger.hpp"
#include "coordmap/common/exceptions.hpp"
#include <filesystem>
#include <fstream>

using namespace coordmap;
using namespace coordmap::utility;

namespace {

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("coordmap_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        std::filesystem::remove_all(dir_);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::filesystem::create_directories(dir_);
        std::ofstream file(dir_ / name);
        file << content;
    }

    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::filesystem::path dir_;
};

} // namespace

// 测试配置文件加载
TEST_F(ConfigManagerTest, LoadCreatesDefaultFiles) {
    auto& config_manager = ConfigManager::getInstance();

    EXPECT_TRUE(config_manager.loadConfigs(dir_.string()));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "core.json"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "reference.json"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "stats.json"));

    auto logger_config = config_manager.getComponentConfig(ConfigFileType::CORE, "logger");
    EXPECT_TRUE(logger_config.value("console_enabled", false));
    EXPECT_FALSE(logger_config.value("file_enabled", true));
    EXPECT_EQ(logger_config.value("level", std::string()), "warn");

    // 再次加载读取刚写出的文件
    config_manager.reset();
    EXPECT_TRUE(config_manager.loadConfigs(dir_.string()));
    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::STATS, "stats.pca.tol_ratio", -1.0), 0.01);
    EXPECT_TRUE(config_manager.validateConfigs());
}

TEST_F(ConfigManagerTest, DefaultsWithoutLoading) {
    auto& config_manager = ConfigManager::getInstance();

    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::REFERENCE, "reference.affine.singular_threshold", -1.0), 0.0);
    EXPECT_TRUE(config_manager.getConfigValue<bool>(
        ConfigFileType::STATS, "stats.pca.standardize", false));
    EXPECT_EQ(config_manager.getConfigValue<int>(
        ConfigFileType::CORE, "core.logger.max_files", 0), 5);
    EXPECT_TRUE(config_manager.getComponentConfig(ConfigFileType::CORE, "nonexistent").empty());
}

// 测试配置值设置和获取
TEST_F(ConfigManagerTest, ConfigValueSetGet) {
    auto& config_manager = ConfigManager::getInstance();

    // 路径不存在时返回默认值
    EXPECT_EQ(config_manager.getConfigValue<int>(ConfigFileType::STATS, "stats.pca.missing", 42), 42);
    // 类型不符时返回默认值
    EXPECT_EQ(config_manager.getConfigValue<int>(ConfigFileType::CORE, "core.logger.level", 7), 7);

    config_manager.setConfigValue(ConfigFileType::REFERENCE, "reference.affine.singular_threshold", 1e-6);
    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::REFERENCE, "reference.affine.singular_threshold", 0.0), 1e-6);

    // 中间节点自动创建
    config_manager.setConfigValue(ConfigFileType::STATS, "stats.extra.name", "value");
    EXPECT_EQ(config_manager.getConfigValue<std::string>(
        ConfigFileType::STATS, "stats.extra.name", ""), "value");
    // 其他键保持默认
    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::STATS, "stats.pca.tol_ratio", 0.0), 0.01);
}

TEST_F(ConfigManagerTest, YamlLoadMergesDefaults) {
    writeFile("stats.yaml",
              "stats:\n"
              "  pca:\n"
              "    tol_ratio: 0.05\n"
              "    label: \"42\"\n");
    writeFile("core.yml",
              "core:\n"
              "  logger:\n"
              "    level: debug\n"
              "    file_enabled: false\n");

    auto& config_manager = ConfigManager::getInstance();
    EXPECT_TRUE(config_manager.loadConfigs(dir_.string()));

    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::STATS, "stats.pca.tol_ratio", 0.0), 0.05);
    // 文件中未出现的键来自默认配置
    EXPECT_TRUE(config_manager.getConfigValue<bool>(
        ConfigFileType::STATS, "stats.pca.standardize", false));
    // 带引号的数字保持为字符串
    EXPECT_EQ(config_manager.getConfigValue<std::string>(
        ConfigFileType::STATS, "stats.pca.label", ""), "42");

    EXPECT_EQ(config_manager.getConfigValue<std::string>(
        ConfigFileType::CORE, "core.logger.level", ""), "debug");
    EXPECT_EQ(config_manager.getConfigValue<int>(
        ConfigFileType::CORE, "core.logger.max_files", 0), 5);

    // reference 没有文件，写出默认 JSON
    EXPECT_TRUE(std::filesystem::exists(dir_ / "reference.json"));
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    auto& config_manager = ConfigManager::getInstance();
    config_manager.setConfigValue(ConfigFileType::STATS, "stats.pca.tol_ratio", 0.125);
    config_manager.setConfigValue(ConfigFileType::STATS, "stats.pca.standardize", false);

    std::filesystem::create_directories(dir_);
    EXPECT_TRUE(config_manager.saveConfig(ConfigFileType::STATS, path("saved.yaml")));
    EXPECT_TRUE(config_manager.saveConfig(ConfigFileType::STATS, path("saved.json")));
    // 未加载过文件且未指定路径
    EXPECT_FALSE(config_manager.saveConfig(ConfigFileType::REFERENCE));

    for (const char* name : {"saved.yaml", "saved.json"}) {
        config_manager.reset();
        ASSERT_TRUE(config_manager.loadConfig(ConfigFileType::STATS, path(name))) << name;
        EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
            ConfigFileType::STATS, "stats.pca.tol_ratio", 0.0), 0.125) << name;
        EXPECT_FALSE(config_manager.getConfigValue<bool>(
            ConfigFileType::STATS, "stats.pca.standardize", true)) << name;
    }
}

TEST_F(ConfigManagerTest, MalformedFileFallsBackToDefaults) {
    writeFile("broken.json", "{ \"stats\": { \"pca\": ");

    auto& config_manager = ConfigManager::getInstance();
    EXPECT_FALSE(config_manager.loadConfig(ConfigFileType::STATS, path("broken.json")));
    EXPECT_DOUBLE_EQ(config_manager.getConfigValue<double>(
        ConfigFileType::STATS, "stats.pca.tol_ratio", 0.0), 0.01);
}

// 测试配置验证
TEST_F(ConfigManagerTest, Validation) {
    auto& config_manager = ConfigManager::getInstance();
    EXPECT_TRUE(config_manager.validateConfigs());

    config_manager.setConfigValue(ConfigFileType::STATS, "stats.pca.tol_ratio", 1.0);
    EXPECT_FALSE(config_manager.validateConfig(ConfigFileType::STATS));

    config_manager.setConfigValue(ConfigFileType::REFERENCE, "reference.affine.singular_threshold", -1.0);
    EXPECT_FALSE(config_manager.validateConfig(ConfigFileType::REFERENCE));

    config_manager.setConfigValue(ConfigFileType::CORE, "core.logger.level", "verbose");
    EXPECT_FALSE(config_manager.validateConfig(ConfigFileType::CORE));
    config_manager.setConfigValue(ConfigFileType::CORE, "core.logger.level", "info");
    EXPECT_TRUE(config_manager.validateConfig(ConfigFileType::CORE));
    config_manager.setConfigValue(ConfigFileType::CORE, "core.logger.max_files", 0);
    EXPECT_FALSE(config_manager.validateConfig(ConfigFileType::CORE));

    EXPECT_FALSE(config_manager.validateConfigs());
}

TEST_F(ConfigManagerTest, TypeStrings) {
    EXPECT_EQ(ConfigManager::configTypeToString(ConfigFileType::REFERENCE), "reference");
    EXPECT_EQ(ConfigManager::stringToConfigType("stats"), ConfigFileType::STATS);
    EXPECT_EQ(ConfigManager::stringToConfigType("core"), ConfigFileType::CORE);
    EXPECT_THROW(ConfigManager::stringToConfigType("dynamics"), ConfigurationError);

    EXPECT_EQ(detectConfigFormat("a/b/core.YAML"), ConfigFileFormat::YAML);
    EXPECT_EQ(detectConfigFormat("stats.yml"), ConfigFileFormat::YAML);
    EXPECT_EQ(detectConfigFormat("stats.json"), ConfigFileFormat::JSON);
    EXPECT_EQ(detectConfigFormat("stats"), ConfigFileFormat::JSON);
}

// ==================== 日志系统测试 ====================

TEST(SimpleLoggerTest, ComponentLoggers) {
    auto& logger = SimpleLogger::getInstance();
    ASSERT_NE(logger.getMainLogger(), nullptr);

    auto component = logger.getComponentLogger("reference.map");
    ASSERT_NE(component, nullptr);
    EXPECT_EQ(component->name(), "coordmap.reference.map");
    // 同名组件返回同一个日志器
    EXPECT_EQ(logger.getComponentLogger("reference.map"), component);
    EXPECT_NE(logger.getComponentLogger("stats.pca"), component);

    LOG_COMPONENT_NAMED_DEBUG("reference.map", "test message {}", 1);
    logger.flush();
}

TEST(SimpleLoggerTest, LogLevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::ERR);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::OFF);
    EXPECT_EQ(logLevelFromString("bogus"), LogLevel::INFO);
}
