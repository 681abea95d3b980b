#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include "cli/sshlite_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const SshLiteCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::host("    sshlite ") << theme::paint(theme::color::HEADING, "<command> <host> [args...]")
              << "\n\n";
    std::cout << theme::dim("    <host> is a name from the hosts: list or user@address[:port]") << "\n";
    cli.print_help();
    std::cout << theme::dim("    sshlite --config <file>   Use another config file\n"
                            "    sshlite --version         Show version\n"
                            "    sshlite --help            Show this help")
              << "\n\n";
}

int main(int argc, char** argv) {
    try {
        SshLiteCLI cli;

        std::optional<std::string> config_path;
        std::vector<std::string> rest;
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc && rest.empty()) {
                config_path = argv[++i];
            } else {
                rest.push_back(a);
            }
        }

        if (rest.empty() || rest[0] == "--help") {
            print_usage(cli);
            return rest.empty() ? 1 : 0;
        }
        if (rest[0] == "--version") {
            std::cout << theme::paint(theme::color::HEADING + theme::color::BOLD, "sshlite")
                      << theme::dim(std::string(" version ") + theme::version()) << "\n";
            return 0;
        }

        std::string cmd = rest[0];
        std::vector<std::string> args(rest.begin() + 1, rest.end());
        return cli.run_command(cmd, args, config_path);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
