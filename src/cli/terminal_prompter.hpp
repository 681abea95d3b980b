#pragma once

#include <mutex>
#include <core/prompter.hpp>

// Prompter on the controlling terminal.  Secrets are read with echo off.
// Questions from different threads are asked one at a time.
class TerminalPrompter : public Prompter {
public:
    std::optional<std::string> prompt_secret(const std::string& message) override;
    bool confirm_save_secret(const std::string& message) override;
    HostKeyDecision confirm_host_key(const HostKeyPrompt& prompt) override;
    std::optional<size_t> choose_credential(const HostConfig& host,
                                            const std::vector<Credential>& choices) override;

private:
    std::mutex mutex_;

    std::optional<std::string> read_line();
};
