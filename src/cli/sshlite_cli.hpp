#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <optional>

// Forward declarations for command registration
void register_remote_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_connection_commands(BaseCLI& cli);
void register_credentials_commands(BaseCLI& cli);

class SshLiteCLI : public BaseCLI {
public:
    SshLiteCLI();

    // Load config, run one command, tear everything down.  Returns the
    // process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args,
                    const std::optional<std::string>& config_path);

private:
    void register_all_commands();
};
