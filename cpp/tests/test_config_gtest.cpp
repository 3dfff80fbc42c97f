// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// Окружение подменяется через EnvLookup, YAML пишется во временную директорию.
//
// ==============================================================================

#include "turbosort/config.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <map>
#include <string>

namespace turbosort::config::test {

namespace fs = std::filesystem;

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

class ConfigFileTest : public turbosort::test::TempDirTest {};

// ==============================================================================
// Значения по умолчанию
// ==============================================================================

TEST(ConfigTest, Load_NoInputs_UsesDefaults) {
    // Act
    ConfigResult result = load(std::nullopt, env_from({}));

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    const Config& cfg = result.config;
    EXPECT_EQ(cfg.source_kind, SourceKind::Local);
    EXPECT_EQ(cfg.source_dir, fs::path("source"));
    EXPECT_EQ(cfg.dest_dir, fs::path("destination"));
    EXPECT_EQ(cfg.history_file, fs::path("turbosort_history.json"));
    EXPECT_EQ(cfg.marker_name, ".turbosort");
    EXPECT_FALSE(cfg.year_prefix);
    EXPECT_TRUE(cfg.drive_suffix);
    EXPECT_EQ(cfg.drive_suffix_name, "incoming");
    EXPECT_FALSE(cfg.force_recopy);
    EXPECT_EQ(cfg.debounce_seconds, 2u);
    EXPECT_EQ(cfg.stats_interval, 300u);
    EXPECT_EQ(cfg.s3_poll_interval, 60u);
    EXPECT_EQ(cfg.s3.bucket, "turbosort-source");
}

// ==============================================================================
// Окружение
// ==============================================================================

TEST(ConfigTest, Load_Environment_OverridesDefaults) {
    ConfigResult result = load(std::nullopt, env_from({
                                                 {"SOURCE_DIR", "/data/in"},
                                                 {"DEST_DIR", "/data/out"},
                                                 {"ENABLE_YEAR_PREFIX", "yes"},
                                                 {"ENABLE_DRIVE_SUFFIX", "false"},
                                                 {"FORCE_RECOPY", " TRUE "},
                                                 {"DEBOUNCE_SECONDS", "5"},
                                                 {"MARKER_FILE", ".route"},
                                             }));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.source_dir, fs::path("/data/in"));
    EXPECT_EQ(result.config.dest_dir, fs::path("/data/out"));
    EXPECT_TRUE(result.config.year_prefix);
    EXPECT_FALSE(result.config.drive_suffix);
    EXPECT_TRUE(result.config.force_recopy);
    EXPECT_EQ(result.config.debounce_seconds, 5u);
    EXPECT_EQ(result.config.marker_name, ".route");
}

TEST(ConfigTest, Load_HistoryFile_WinsOverHistoryDir) {
    ConfigResult dir_only = load(std::nullopt, env_from({{"HISTORY_DIR", "/state"}}));
    ASSERT_TRUE(dir_only.ok);
    EXPECT_EQ(dir_only.config.history_file, fs::path("/state/turbosort_history.json"));

    ConfigResult both = load(std::nullopt, env_from({{"HISTORY_DIR", "/state"},
                                                     {"HISTORY_FILE", "/other/h.json"}}));
    ASSERT_TRUE(both.ok);
    EXPECT_EQ(both.config.history_file, fs::path("/other/h.json"));
}

TEST(ConfigTest, Load_S3Settings) {
    ConfigResult result = load(std::nullopt, env_from({
                                                 {"USE_S3_SOURCE", "1"},
                                                 {"S3_ENDPOINT", "http://localhost:9000"},
                                                 {"S3_BUCKET", "inbox"},
                                                 {"S3_PATH_PREFIX", "drop/"},
                                                 {"S3_POLL_INTERVAL", "15"},
                                             }));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.source_kind, SourceKind::S3);
    EXPECT_EQ(result.config.s3.endpoint, "http://localhost:9000");
    EXPECT_EQ(result.config.s3.bucket, "inbox");
    EXPECT_EQ(result.config.s3.prefix, "drop/");
    EXPECT_EQ(result.config.s3_poll_interval, 15u);
}

TEST(ConfigTest, Load_InvalidBoolean_ReportsVariable) {
    ConfigResult result = load(std::nullopt, env_from({{"FORCE_RECOPY", "maybe"}}));

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("FORCE_RECOPY"), std::string::npos);
}

TEST(ConfigTest, Load_InvalidInteger_Fails) {
    EXPECT_FALSE(load(std::nullopt, env_from({{"DEBOUNCE_SECONDS", "-1"}})).ok);
    EXPECT_FALSE(load(std::nullopt, env_from({{"STATS_INTERVAL", "12abc"}})).ok);
}

TEST(ConfigTest, Load_MarkerWithSlash_Fails) {
    EXPECT_FALSE(load(std::nullopt, env_from({{"MARKER_FILE", "a/b"}})).ok);
}

TEST(ConfigTest, Validate_DriveSuffixMustBeSegment) {
    ConfigResult result = load(std::nullopt, env_from({{"DRIVE_SUFFIX", "in/coming"}}));
    EXPECT_FALSE(result.ok);

    // Суффикс выключен - значение не проверяется
    ConfigResult disabled = load(std::nullopt, env_from({{"DRIVE_SUFFIX", "in/coming"},
                                                         {"ENABLE_DRIVE_SUFFIX", "off"}}));
    EXPECT_TRUE(disabled.ok);
}

TEST(ConfigTest, Validate_S3RequiresBucket) {
    ConfigResult result =
        load(std::nullopt, env_from({{"USE_S3_SOURCE", "true"}, {"S3_BUCKET", ""}}));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("S3_BUCKET"), std::string::npos);
}

// ==============================================================================
// Разбор значений
// ==============================================================================

TEST(ConfigTest, ParseBool_AcceptedSpellings) {
    EXPECT_EQ(parse_bool("On"), true);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("").has_value());
    EXPECT_FALSE(parse_bool("2").has_value());
}

TEST(ConfigTest, ParseUint_Bounds) {
    EXPECT_EQ(parse_uint("0"), 0u);
    EXPECT_EQ(parse_uint("4294967295"), 4294967295u);
    EXPECT_FALSE(parse_uint("4294967296").has_value());
    EXPECT_FALSE(parse_uint("").has_value());
}

// ==============================================================================
// YAML файл
// ==============================================================================

TEST_F(ConfigFileTest, Load_YamlFile_ThenEnvironmentWins) {
    // Arrange
    fs::path file = test_dir_ / "turbosort.yaml";
    write_file(file, "source_dir: /yaml/in\n"
                     "dest_dir: /yaml/out\n"
                     "enable_year_prefix: true\n"
                     "debounce_seconds: 7\n");

    // Act
    ConfigResult result = load(file, env_from({{"DEST_DIR", "/env/out"}}));

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.source_dir, fs::path("/yaml/in"));
    EXPECT_EQ(result.config.dest_dir, fs::path("/env/out"));
    EXPECT_TRUE(result.config.year_prefix);
    EXPECT_EQ(result.config.debounce_seconds, 7u);
}

TEST_F(ConfigFileTest, Load_ConfigPathFromEnvironment) {
    fs::path file = test_dir_ / "cfg.yaml";
    write_file(file, "marker_file: .dest\n");

    ConfigResult result =
        load(std::nullopt, env_from({{"TURBOSORT_CONFIG", file.string()}}));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.marker_name, ".dest");
}

TEST_F(ConfigFileTest, Load_YamlHistoryFile_WinsRegardlessOfKeyOrder) {
    // Arrange: history_dir записан после history_file
    fs::path file = test_dir_ / "cfg.yaml";
    write_file(file, "history_file: /other/h.json\n"
                     "history_dir: /state\n");

    // Act
    ConfigResult result = load(file, env_from({}));

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.history_file, fs::path("/other/h.json"));
}

TEST_F(ConfigFileTest, Load_UnknownKey_Fails) {
    fs::path file = test_dir_ / "bad.yaml";
    write_file(file, "sourcedir: /x\n");

    ConfigResult result = load(file, env_from({}));

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("sourcedir"), std::string::npos);
}

TEST_F(ConfigFileTest, Load_MissingFile_Fails) {
    ConfigResult result = load(test_dir_ / "absent.yaml", env_from({}));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("cannot read"), std::string::npos);
}

TEST_F(ConfigFileTest, Load_EmptyFile_UsesDefaults) {
    fs::path file = test_dir_ / "empty.yaml";
    write_file(file, "");

    ConfigResult result = load(file, env_from({}));

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.marker_name, ".turbosort");
}

TEST_F(ConfigFileTest, Load_NonMapping_Fails) {
    fs::path file = test_dir_ / "list.yaml";
    write_file(file, "- a\n- b\n");

    EXPECT_FALSE(load(file, env_from({})).ok);
}

}  // namespace turbosort::config::test
