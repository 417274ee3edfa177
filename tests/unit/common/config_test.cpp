/// @file config_test.cpp
/// @brief Tests for rulemux configuration management

#include <gtest/gtest.h>

#include <cstdlib>

#include "common/config.h"

namespace rulemux {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
data_dir: /var/lib/rulemux
eval_interval: 30s
query:
  endpoints:
    - http://querier-a:9090
    - http://querier-b:9090
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("data_dir"), "/var/lib/rulemux");
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto endpoints = config.GetStringList("query.endpoints");
    ASSERT_EQ(endpoints.size(), 2);
    EXPECT_EQ(endpoints[0], "http://querier-a:9090");
    EXPECT_EQ(endpoints[1], "http://querier-b:9090");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("test.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetStringList("test.list"), (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, SetKeepsSiblings) {
    Config config;

    config.Set("grpc.address", std::string("0.0.0.0:1"));
    config.Set("grpc.other", std::string("x"));
    config.Set("http.address", std::string("0.0.0.0:2"));

    EXPECT_EQ(config.GetString("grpc.address"), "0.0.0.0:1");
    EXPECT_EQ(config.GetString("grpc.other"), "x");
    EXPECT_EQ(config.GetString("http.address"), "0.0.0.0:2");
}

TEST(ConfigTest, ReadsDoNotCreateKeys) {
    Config config;
    config.Set("a.b", std::string("c"));

    EXPECT_FALSE(config.HasKey("a.missing"));
    EXPECT_FALSE(config.HasKey("a.missing"));
    EXPECT_EQ(config.GetString("a.b"), "c");
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added
}

TEST(ConfigTest, GetDuration) {
    auto result = Config::LoadFromString("eval_interval: 1m30s\nbad: soon\n");
    ASSERT_TRUE(result.ok());

    auto interval = result->GetDuration("eval_interval", std::chrono::seconds(1));
    ASSERT_TRUE(interval.ok());
    EXPECT_EQ(*interval, std::chrono::seconds(90));

    auto missing = result->GetDuration("missing", std::chrono::seconds(7));
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(*missing, std::chrono::seconds(7));

    auto bad = result->GetDuration("bad", std::chrono::seconds(1));
    EXPECT_FALSE(bad.ok());
    EXPECT_NE(bad.status().message().find("bad"), std::string_view::npos);
}

TEST(ConfigTest, LoadFromEnvironment) {
    setenv("RULEMUX_TEST_DATA_DIR", "/tmp/rulemux-env", 1);
    setenv("RULEMUX_TEST_RULE_FILES", "a/*.yaml,b/*.yml", 1);
    setenv("RULEMUX_TEST_LOG_LEVEL", "warn", 1);

    Config config = Config::LoadFromEnvironment("RULEMUX_TEST_");

    EXPECT_EQ(config.GetString("data_dir"), "/tmp/rulemux-env");
    EXPECT_EQ(config.GetStringList("rule_files"),
              (std::vector<std::string>{"a/*.yaml", "b/*.yml"}));
    EXPECT_EQ(config.GetString("logging.level"), "warn");
    EXPECT_FALSE(config.HasKey("grpc.address"));

    unsetenv("RULEMUX_TEST_DATA_DIR");
    unsetenv("RULEMUX_TEST_RULE_FILES");
    unsetenv("RULEMUX_TEST_LOG_LEVEL");
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, MissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/rulemux.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace rulemux
