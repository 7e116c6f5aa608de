#include "stagehand_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <managers/process_supervisor.hpp>
#include <managers/sync_manager.hpp>
#include <ssh/sftp_session.hpp>
#include <fmt/format.h>
#include <iostream>
#include <sstream>

Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine cl;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--") {
            cl.extra_args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        }
        if (a == "-c" || a == "--config") {
            if (i + 1 >= args.size()) {
                return Result<CommandLine>::Err(fmt::format("Missing file name after {}", a));
            }
            cl.config_path = args[++i];
        } else if (cl.command.empty()) {
            cl.command = a;
        } else {
            cl.positional.push_back(a);
        }
    }
    if (cl.command.empty()) {
        return Result<CommandLine>::Err("Missing command");
    }
    return Result<CommandLine>::Ok(cl);
}

StagehandCLI::StagehandCLI(CancellationToken cancel) : cancel_(std::move(cancel)) {
}

void StagehandCLI::print_usage() const {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("stagehand publish", "<source-dir> [-c file]", "Publish a build to the target");
    std::cout << theme::usage("stagehand run", "[-c file] [-- args]", "Run the configured deployment tool");
    std::cout << theme::usage("stagehand init", "[-c file]", "Write a default stagehand.yaml");
    std::cout << "\n";
    std::cout << theme::dim("    stagehand --version        Show version\n"
                            "    stagehand --help           Show this help") << "\n\n";
}

std::optional<Config> StagehandCLI::load_config(const std::string& config_path) {
    auto result = config_path.empty() ? Config::load_from_dir() : Config::load(config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Run 'stagehand init' to create one.");
        return std::nullopt;
    }
    if (result.value.log_path()) {
        set_log_path(*result.value.log_path());
    }
    return result.value;
}

// ── publish ────────────────────────────────────────────────

int StagehandCLI::run_publish(const std::string& source_dir, const std::string& config_path) {
    auto config = load_config(config_path);
    if (!config) return 1;

    const auto& target = config->target();
    if (target.host.empty()) {
        std::cout << theme::fail("target.host is not set");
        return 1;
    }

    auto status = [](const std::string& msg) { std::cout << theme::log(msg) << std::flush; };

    try {
        std::cout << theme::kv("target", fmt::format("{}@{}:{}", target.user, target.host, target.port));
        std::cout << theme::kv("base", target.base_path);
        std::cout << theme::kv("source", source_dir);
        auto session = SftpSession::connect(target, status);

        SyncManager sync(*session, SyncSettings::from(target, config->publish()), status);
        ChangeSummary summary = sync.publish(config->rules(), source_dir, cancel_);

        std::cout << theme::ok(fmt::format("Published {} to {}", source_dir, sync.settings().base_path.path()));
        std::cout << "\n" << summary.to_display_string() << "\n";
        return summary.exit_code;
    } catch (const SyncError& e) {
        std::cout << theme::fail(e.what());
        if (e.partial_summary()) {
            std::cout << theme::step("Completed before the failure:");
            std::cout << "\n" << e.partial_summary()->to_display_string() << "\n";
        }
        std::cout << theme::step("Details in " + stagehand_log_path());
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cout << theme::fail(e.what());
        return 1;
    }
}

// ── run ────────────────────────────────────────────────────

int StagehandCLI::run_tool(const std::string& config_path, const std::vector<std::string>& extra_args) {
    auto config = load_config(config_path);
    if (!config) return 1;

    const auto& tool = config->tool();
    if (tool.path.empty()) {
        std::cout << theme::fail("tool.path is not set");
        return 1;
    }

    std::vector<std::string> args = tool.args;
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    ProcessSupervisor supervisor(tool.poll_interval_ms,
        [](const std::string& msg) { std::cout << theme::log(msg) << std::flush; });

    try {
        // No output callbacks: the tool writes straight to this terminal.
        ProcessOutcome outcome = supervisor.execute(tool.path, args, tool.environment,
                                                    nullptr, nullptr, cancel_);
        if (outcome.success()) {
            std::cout << theme::ok("Tool finished");
            return 0;
        }
        if (outcome.cancelled) {
            std::cout << theme::fail("Cancelled");
        } else if (!outcome.started) {
            std::cout << theme::fail(fmt::format("Could not start {}", tool.path));
        } else {
            std::cout << theme::fail(fmt::format("Tool failed with exit code {}", outcome.exit_code));
        }
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cout << theme::fail(e.what());
        return 1;
    }
}

// ── init ───────────────────────────────────────────────────

int StagehandCLI::run_init(const std::string& config_path) {
    fs::path path = config_path.empty() ? get_config_path() : fs::path(config_path);
    if (fs::exists(path)) {
        std::cout << theme::step(fmt::format("{} already exists", path.string()));
        return 0;
    }
    auto created = create_default_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Wrote {}", path.string()));
    return 0;
}
