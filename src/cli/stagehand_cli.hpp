#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/cancellation.hpp>
#include <core/config.hpp>
#include <core/types.hpp>

// Parsed command line: `stagehand <command> [positional...] [-c file] [-- extra...]`
struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::string config_path;                 // empty: ./stagehand.yaml
    std::vector<std::string> extra_args;     // everything after "--"
};

Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

class StagehandCLI {
public:
    explicit StagehandCLI(CancellationToken cancel);

    // Each returns the process exit code.
    int run_publish(const std::string& source_dir, const std::string& config_path);
    int run_tool(const std::string& config_path, const std::vector<std::string>& extra_args);
    int run_init(const std::string& config_path);

    void print_usage() const;

private:
    CancellationToken cancel_;

    std::optional<Config> load_config(const std::string& config_path);
};
