#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <ssh/libssh2_transport.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

BaseCLI::~BaseCLI() {
    // Stop timers first so no reconnect attempt races the teardown
    if (scheduler) scheduler->shutdown();
    if (registry) registry->shutdown();
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    commands_[name] = Command{std::move(handler), usage, help};
}

bool BaseCLI::init(const std::optional<std::string>& config_path) {
    auto loaded = config_path ? Config::load(*config_path) : Config::load_global();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config = loaded.value;

    const auto& core = config->core();
    trust_store = std::make_unique<YamlFileStore>(config->trust_store_path());
    credential_index = std::make_unique<YamlFileStore>(config->credential_index_path());
    secret_store = std::make_unique<SecretFileStore>(config->secrets_path());
    credentials = std::make_unique<CredentialManager>(*secret_store, *credential_index);
    prompter = std::make_unique<TerminalPrompter>();
    auth = std::make_unique<AuthResolver>(*credentials, *prompter);
    verifier = std::make_unique<HostIdentityVerifier>(*trust_store, *prompter,
                                                      core.host_verify_timeout_ms);
    scheduler = std::make_unique<TimerScheduler>();

    auto factory = [this](const HostConfig& host, const std::optional<Credential>& credential) {
        SessionDeps deps{
            [] { return std::unique_ptr<Transport>(new Libssh2Transport()); },
            *auth, *verifier, config->core()};
        return std::make_shared<Session>(host, credential, deps);
    };
    registry = std::make_unique<SessionRegistry>(factory, *credentials, *prompter,
                                                 *scheduler, core);
    search = std::make_unique<RemoteSearchEngine>(core);

    registry->reconnect_events().subscribe([](const ReconnectEvent& ev) {
        std::cout << theme::reconnect(ev, remediation_hint(ev.kind)) << std::flush;
    });
    return true;
}

int BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'sshlite --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        sshlite_log(fmt::format("Command {} threw: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

bool BaseCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Commands", {"exec", "shell", "repl", "search"}},
        {"Files",    {"ls", "cat", "head", "tail", "put", "mkdir", "rm", "mv", "watch"}},
        {"Network",  {"forward", "status"}},
        {"Trust",    {"credentials", "trust-forget"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::paint(theme::color::HEADING + theme::color::BOLD, "  " + cat_name)
                  << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::command_row(name, it->second.help);
        }
    }
    std::cout << "\n";
}

void BaseCLI::print_usage(const std::string& command) const {
    auto it = commands_.find(command);
    if (it == commands_.end()) return;
    std::cout << theme::step("Usage: sshlite " + command + " " + it->second.usage);
}

std::optional<HostConfig> BaseCLI::resolve_host(const std::string& target) {
    if (config) {
        if (auto named = config->find_host(target)) return named;
    }
    auto parsed = parse_host_spec(target);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return std::nullopt;
    }
    return parsed.value;
}

std::shared_ptr<Session> BaseCLI::require_session(const std::string& target) {
    auto host = resolve_host(target);
    if (!host) return nullptr;

    auto session = registry->connect(*host);
    if (session.is_err()) {
        report("Connection to " + host->display() + " failed", session.error, session.kind);
        return nullptr;
    }
    return session.value;
}

void BaseCLI::report(const std::string& what, const std::string& error, ErrorKind kind) const {
    std::cout << theme::error(fmt::format("{}: {}", what, error), remediation_hint(kind));
}
