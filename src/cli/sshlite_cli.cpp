#include "sshlite_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

SshLiteCLI::SshLiteCLI() : BaseCLI() {
    register_all_commands();
}

void SshLiteCLI::register_all_commands() {
    add_command("help", [](BaseCLI& cli, const Args&) {
        cli.print_help();
        return 0;
    }, "", "Show this help message");

    register_remote_commands(*this);
    register_file_commands(*this);
    register_connection_commands(*this);
    register_credentials_commands(*this);
}

int SshLiteCLI::run_command(const std::string& command, const std::vector<std::string>& args,
                            const std::optional<std::string>& config_path) {
    if (!has_command(command)) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'sshlite --help' for available commands.");
        return 1;
    }
    if (command == "help") return execute_command(command, args);

    if (!init(config_path)) return 1;
    sshlite_log(fmt::format("Running '{}' with {} argument(s)", command, args.size()));

    int status = execute_command(command, args);
    registry->disconnect_all();
    return status;
}
