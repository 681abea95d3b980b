#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include <core/prompter.hpp>
#include "transport.hpp"

// Process inputs the resolver reads: default key files and the agent socket.
struct AuthEnvironment {
    std::vector<std::string> default_keys;
    std::string agent_socket;               // empty when no agent

    // DEFAULT_KEY_FILES expanded, plus $SSH_AUTH_SOCK
    static AuthEnvironment from_process();
};

// True for PEM keys marked ENCRYPTED and for new-format OpenSSH keys whose
// cipher is not "none".
bool key_needs_passphrase(const std::string& key_text);

// Builds the ordered method list the transport tries for one connect attempt.
//
// With an explicit credential only that credential's material is offered,
// followed by keyboard-interactive.  Without one: configured key, default
// keys, agent, stored-or-prompted password, keyboard-interactive.
class AuthResolver {
public:
    AuthResolver(CredentialManager& credentials, Prompter& prompter,
                 AuthEnvironment env = AuthEnvironment::from_process());

    Result<AuthOffer> build_offer(const HostConfig& host,
                                  const std::optional<Credential>& credential);

    // The offer authenticated: persist what was typed in while building it.
    void commit(const HostConfig& host, const AuthOffer& offer);

    // Authentication failed: every stored secret for the host is stale.
    void invalidate(const HostConfig& host);

    const AuthEnvironment& environment() const { return env_; }

private:
    CredentialManager& credentials_;
    Prompter& prompter_;
    AuthEnvironment env_;

    Result<AuthOffer> explicit_offer(const HostConfig& host, const Credential& credential);
    Result<AuthOffer> probing_offer(const HostConfig& host);

    AuthAttempt keyboard_interactive(const HostConfig& host, const std::string& secret);
};
