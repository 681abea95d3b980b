#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include <core/store.hpp>
#include <core/prompter.hpp>
#include "transport.hpp"

// Checks a presented host key against the trust store ("address:port" ->
// "SHA256:..."), asking the user on first sight or on change.
//
// A replacement key the user rejected is remembered under
// "rejected:address:port" and refused without prompting until forget().
class HostIdentityVerifier {
public:
    HostIdentityVerifier(KeyValueStore& trust_store, Prompter& prompter,
                         int prompt_timeout_ms = 120000);

    Result<void> verify(const PresentedHostKey& key);

    // Adapter for Transport::open
    HostKeyCheck as_check();

    std::optional<std::string> trusted(const std::string& address, int port);
    Result<void> forget(const std::string& address, int port);

    static std::string store_key(const std::string& address, int port);

private:
    KeyValueStore& store_;
    Prompter& prompter_;
    int prompt_timeout_ms_;

    std::optional<HostKeyDecision> ask(const HostKeyPrompt& prompt);
};
