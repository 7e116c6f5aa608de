#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include "cli/stagehand_cli.hpp"
#include "cli/theme.hpp"
#include <core/cancellation.hpp>
#include <core/constants.hpp>

static CancellationToken g_cancel;

static void on_sigint(int) {
    g_cancel.cancel();
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);

    try {
        StagehandCLI cli(g_cancel);
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty()) {
            cli.print_usage();
            return 1;
        }
        if (args[0] == "--version") {
            std::cout << theme::bold("stagehand") << theme::dim(std::string(" version ") + STAGEHAND_VERSION) << "\n";
            return 0;
        }
        if (args[0] == "--help" || args[0] == "help") {
            cli.print_usage();
            return 0;
        }

        auto parsed = parse_command_line(args);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            cli.print_usage();
            return 1;
        }
        const CommandLine& cl = parsed.value;

        if (cl.command == "publish") {
            if (cl.positional.empty()) {
                std::cout << theme::fail("Missing source directory.");
                std::cout << theme::step("Usage: stagehand publish <source-dir> [-c file]");
                return 1;
            }
            return cli.run_publish(cl.positional[0], cl.config_path);
        } else if (cl.command == "run") {
            return cli.run_tool(cl.config_path, cl.extra_args);
        } else if (cl.command == "init") {
            return cli.run_init(cl.config_path);
        }

        std::cout << theme::fail("Unknown command: " + cl.command);
        cli.print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
