#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <core/store.hpp>
#include <core/credentials.hpp>
#include <core/scheduler.hpp>
#include <ssh/auth.hpp>
#include <ssh/host_verifier.hpp>
#include <ssh/session.hpp>
#include <managers/session_registry.hpp>
#include <managers/search_engine.hpp>
#include "terminal_prompter.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<int(BaseCLI&, const Args&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Load the configuration and build every service.  Prints and returns
    // false on failure.
    bool init(const std::optional<std::string>& config_path);

    int execute_command(const std::string& command, const Args& args);
    bool has_command(const std::string& command) const;
    void print_help() const;
    void print_usage(const std::string& command) const;

    // Named host from the config, else "user@host[:port]"
    std::optional<HostConfig> resolve_host(const std::string& target);

    // Connect through the registry; prints the failure and returns null.
    std::shared_ptr<Session> require_session(const std::string& target);

    void report(const std::string& what, const std::string& error, ErrorKind kind) const;

    // Services, created once by init() and torn down in reverse order
    std::optional<Config> config;
    std::unique_ptr<YamlFileStore> trust_store;
    std::unique_ptr<YamlFileStore> credential_index;
    std::unique_ptr<SecretFileStore> secret_store;
    std::unique_ptr<CredentialManager> credentials;
    std::unique_ptr<TerminalPrompter> prompter;
    std::unique_ptr<AuthResolver> auth;
    std::unique_ptr<HostIdentityVerifier> verifier;
    std::unique_ptr<TimerScheduler> scheduler;
    std::unique_ptr<SessionRegistry> registry;
    std::unique_ptr<RemoteSearchEngine> search;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
