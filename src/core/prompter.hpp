#pragma once

#include <string>
#include <vector>
#include <optional>
#include "types.hpp"

struct HostKeyPrompt {
    std::string address;
    int port = 22;
    std::string algorithm;
    std::string presented;                      // "SHA256:..."
    std::optional<std::string> stored;          // set when the key changed
};

enum class HostKeyDecision { Accept, AcceptNewKey, Reject };

// Every question the core needs answered by a human goes through here.
// The driver supplies a terminal implementation; tests script one.
class Prompter {
public:
    virtual ~Prompter() = default;

    // nullopt when the user cancels
    virtual std::optional<std::string> prompt_secret(const std::string& message) = 0;

    virtual bool confirm_save_secret(const std::string& message) = 0;

    virtual HostKeyDecision confirm_host_key(const HostKeyPrompt& prompt) = 0;

    // Index into choices, or nullopt to skip
    virtual std::optional<size_t> choose_credential(const HostConfig& host,
                                                    const std::vector<Credential>& choices) = 0;
};
