#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "rule_configuration.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load a stagehand.yaml file. Missing sections and keys take their
    // documented defaults; invalid values are reported as an error.
    static Result<Config> load(const fs::path& path);

    // Load ./stagehand.yaml (or the given directory's).
    static Result<Config> load_from_dir(const fs::path& dir = fs::current_path());

    // Accessors
    const TargetConfig& target() const { return target_; }
    const PublishConfig& publish() const { return publish_; }
    const RuleConfiguration& rules() const { return rules_; }
    const ToolConfig& tool() const { return tool_; }
    const std::optional<std::string>& log_path() const { return log_path_; }
    const fs::path& config_path() const { return config_path_; }

public:
    Config() = default;

private:
    TargetConfig target_;
    PublishConfig publish_;
    RuleConfiguration rules_;
    ToolConfig tool_;
    std::optional<std::string> log_path_;
    fs::path config_path_;
};

bool config_exists(const fs::path& dir = fs::current_path());

fs::path get_config_path(const fs::path& dir = fs::current_path());

// Write a commented default stagehand.yaml; an existing file is left alone.
Result<void> create_default_config(const fs::path& path);
