#include "config.hpp"
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool config_exists(const fs::path& dir) {
    return fs::exists(get_config_path(dir));
}

fs::path get_config_path(const fs::path& dir) {
    return dir / "stagehand.yaml";
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# Stagehand publish configuration

target:
  host: ""
  port: 22
  user: ""
  password: ""
  # ssh_key_path: "~/.ssh/id_ed25519"
  secure: false                    # require a matching ~/.ssh/known_hosts entry
  timeout: 30
  base_path: "/"

publish:
  batch_size: 20
  max_attempts: 3
  prune_directories: false         # delete remote directories missing locally

rules:
  excludes: []                     # remote path prefixes that are never touched
  app_data_skip: false
  app_data_directory: "App_Data"

# Optional: deployment tool run by `stagehand run`
# tool:
#   path: "/usr/local/bin/deploy"
#   args: []
#   environment: {}

# Optional: log file (default: <tmp>/stagehand.log)
# log:
#   path: "stagehand.log"
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static TargetConfig parse_target_config(const YAML::Node& node) {
    TargetConfig target;
    target.host = node["host"].as<std::string>("");
    target.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    target.user = node["user"].as<std::string>("");
    target.password = node["password"].as<std::string>("");
    target.secure = node["secure"].as<bool>(false);
    target.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    target.base_path = node["base_path"].as<std::string>("/");

    if (node["ssh_key_path"]) {
        target.ssh_key_path = node["ssh_key_path"].as<std::string>();
    }

    return target;
}

static PublishConfig parse_publish_config(const YAML::Node& node) {
    PublishConfig publish;
    publish.batch_size = node["batch_size"].as<int>(DEFAULT_BATCH_SIZE);
    publish.max_attempts = node["max_attempts"].as<int>(DEFAULT_MAX_ATTEMPTS);
    publish.prune_directories = node["prune_directories"].as<bool>(false);
    return publish;
}

static RuleConfiguration parse_rules_config(const YAML::Node& node) {
    RuleConfiguration rules;
    if (node["excludes"]) {
        if (node["excludes"].IsSequence()) {
            for (const auto& e : node["excludes"]) {
                rules.excludes.insert(e.as<std::string>());
            }
        } else if (node["excludes"].IsScalar()) {
            rules.excludes.insert(node["excludes"].as<std::string>());
        }
    }
    rules.app_data_skip_enabled = node["app_data_skip"].as<bool>(false);
    rules.app_data_directory = node["app_data_directory"].as<std::string>(DEFAULT_APP_DATA_DIR);
    return rules;
}

static ToolConfig parse_tool_config(const YAML::Node& node) {
    ToolConfig tool;
    tool.path = node["path"].as<std::string>("");
    tool.args = node["args"].as<std::vector<std::string>>(std::vector<std::string>());
    tool.poll_interval_ms = node["poll_interval_ms"].as<int>(PROCESS_POLL_INTERVAL_MS);

    if (node["environment"] && node["environment"].IsMap()) {
        for (const auto& kv : node["environment"]) {
            tool.environment[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return tool;
}

static Result<void> validate(const Config& config) {
    if (config.publish().batch_size < 1) {
        return Result<void>::Err(fmt::format("publish.batch_size must be at least 1, got {}",
                                             config.publish().batch_size));
    }
    if (config.publish().max_attempts < 1) {
        return Result<void>::Err(fmt::format("publish.max_attempts must be at least 1, got {}",
                                             config.publish().max_attempts));
    }
    if (config.target().port < 1 || config.target().port > 65535) {
        return Result<void>::Err(fmt::format("target.port {} is out of range", config.target().port));
    }
    if (config.tool().poll_interval_ms < 1) {
        return Result<void>::Err("tool.poll_interval_ms must be positive");
    }
    return Result<void>::Ok();
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        config.target_ = parse_target_config(root["target"] ? root["target"] : YAML::Node());
        config.publish_ = parse_publish_config(root["publish"] ? root["publish"] : YAML::Node());
        config.rules_ = parse_rules_config(root["rules"] ? root["rules"] : YAML::Node());
        config.tool_ = parse_tool_config(root["tool"] ? root["tool"] : YAML::Node());

        if (root["log"] && root["log"]["path"]) {
            config.log_path_ = root["log"]["path"].as<std::string>();
        }
        config.config_path_ = path;
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_err()) {
        return Result<Config>::Err(valid.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_from_dir(const fs::path& dir) {
    return load(get_config_path(dir));
}
