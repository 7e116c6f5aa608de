#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("stagehand_config_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = get_config_path(test_dir);
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, MissingFileIsAnError) {
    auto result = Config::load(test_dir / "nope.yaml");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, EmptyFileUsesDefaults) {
    write_config("");
    auto result = Config::load_from_dir(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    const Config& c = result.value;
    EXPECT_EQ(c.target().port, 22);
    EXPECT_EQ(c.target().base_path, "/");
    EXPECT_FALSE(c.target().secure);
    EXPECT_FALSE(c.target().ssh_key_path.has_value());
    EXPECT_EQ(c.publish().batch_size, DEFAULT_BATCH_SIZE);
    EXPECT_EQ(c.publish().max_attempts, DEFAULT_MAX_ATTEMPTS);
    EXPECT_FALSE(c.publish().prune_directories);
    EXPECT_TRUE(c.rules().excludes.empty());
    EXPECT_FALSE(c.rules().app_data_skip_enabled);
    EXPECT_EQ(c.rules().app_data_directory, "App_Data");
    EXPECT_EQ(c.tool().poll_interval_ms, PROCESS_POLL_INTERVAL_MS);
    EXPECT_FALSE(c.log_path().has_value());
}

TEST_F(ConfigTest, ParsesAllSections) {
    write_config(R"(
target:
  host: "deploy.example.com"
  port: 2222
  user: "web"
  password: "secret"
  ssh_key_path: "/home/web/.ssh/id_ed25519"
  secure: true
  timeout: 10
  base_path: "/var/www/site"
publish:
  batch_size: 5
  max_attempts: 4
  prune_directories: true
rules:
  excludes: ["/var/www/site/logs", "/var/www/site/uploads"]
  app_data_skip: true
  app_data_directory: "Data"
tool:
  path: "/usr/bin/deploy"
  args: ["--verbose", "--target", "prod"]
  environment:
    DEPLOY_ENV: "production"
  poll_interval_ms: 25
log:
  path: "/tmp/stagehand-test.log"
)");
    auto result = Config::load_from_dir(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;

    const Config& c = result.value;
    EXPECT_EQ(c.target().host, "deploy.example.com");
    EXPECT_EQ(c.target().port, 2222);
    EXPECT_EQ(c.target().user, "web");
    EXPECT_EQ(c.target().password, "secret");
    EXPECT_EQ(c.target().ssh_key_path.value_or(""), "/home/web/.ssh/id_ed25519");
    EXPECT_TRUE(c.target().secure);
    EXPECT_EQ(c.target().timeout, 10);
    EXPECT_EQ(c.target().base_path, "/var/www/site");

    EXPECT_EQ(c.publish().batch_size, 5);
    EXPECT_EQ(c.publish().max_attempts, 4);
    EXPECT_TRUE(c.publish().prune_directories);

    EXPECT_EQ(c.rules().excludes.size(), 2u);
    EXPECT_TRUE(c.rules().excludes.count("/var/www/site/logs"));
    EXPECT_TRUE(c.rules().app_data_skip_enabled);
    EXPECT_EQ(c.rules().app_data_directory, "Data");

    EXPECT_EQ(c.tool().path, "/usr/bin/deploy");
    EXPECT_EQ(c.tool().args, (std::vector<std::string>{"--verbose", "--target", "prod"}));
    EXPECT_EQ(c.tool().environment.at("DEPLOY_ENV"), "production");
    EXPECT_EQ(c.tool().poll_interval_ms, 25);
    EXPECT_EQ(c.log_path().value_or(""), "/tmp/stagehand-test.log");
}

TEST_F(ConfigTest, SingleExcludeScalar) {
    write_config("rules:\n  excludes: /logs\n");
    auto result = Config::load_from_dir(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(result.value.rules().excludes.count("/logs"));
}

TEST_F(ConfigTest, RejectsInvalidBatchSettings) {
    write_config("publish:\n  batch_size: 0\n");
    auto result = Config::load_from_dir(test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("batch_size"), std::string::npos);

    write_config("publish:\n  max_attempts: -1\n");
    result = Config::load_from_dir(test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("max_attempts"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    write_config("target: [unclosed\n");
    auto result = Config::load_from_dir(test_dir);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, DefaultConfigRoundTripsThroughLoader) {
    auto path = get_config_path(test_dir);
    ASSERT_TRUE(create_default_config(path).is_ok());
    EXPECT_TRUE(config_exists(test_dir));

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.publish().batch_size, DEFAULT_BATCH_SIZE);
}

TEST_F(ConfigTest, DefaultConfigDoesNotOverwrite) {
    auto path = write_config("publish:\n  batch_size: 7\n");
    ASSERT_TRUE(create_default_config(path).is_ok());

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.publish().batch_size, 7);
}
