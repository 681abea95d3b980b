#include "terminal_prompter.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <iostream>
#include <fmt/format.h>

std::optional<std::string> TerminalPrompter::read_line() {
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return trimmed(line);
}

std::optional<std::string> TerminalPrompter::prompt_secret(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << theme::step(message) << "    " << std::flush;

    std::string value;
    {
        platform::TerminalMode hidden(platform::TerminalMode::HiddenInput);
        if (!std::getline(std::cin, value)) {
            std::cout << "\n";
            return std::nullopt;
        }
    }
    std::cout << "\n";
    if (!value.empty() && value.back() == '\r') value.pop_back();
    return value;
}

bool TerminalPrompter::confirm_save_secret(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << theme::step(message + " [y/N]") << "    " << std::flush;
    auto answer = read_line();
    return answer && (*answer == "y" || *answer == "Y" || *answer == "yes");
}

HostKeyDecision TerminalPrompter::confirm_host_key(const HostKeyPrompt& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string target = fmt::format("{}:{}", prompt.address, prompt.port);

    if (!prompt.stored) {
        std::cout << theme::section("Unknown host");
        std::cout << theme::kv("Host", target);
        std::cout << theme::kv("Key type", prompt.algorithm);
        std::cout << theme::kv("Fingerprint", prompt.presented);
        std::cout << "\n" << theme::step("Trust this host? [y/N]") << "    " << std::flush;
        auto answer = read_line();
        if (answer && (*answer == "y" || *answer == "Y" || *answer == "yes")) {
            return HostKeyDecision::Accept;
        }
        return HostKeyDecision::Reject;
    }

    std::cout << theme::section("HOST KEY CHANGED");
    std::cout << theme::fail("The key presented by " + target + " differs from the trusted one.");
    std::cout << theme::dim("    Someone could be intercepting this connection.") << "\n\n";
    std::cout << theme::kv("Trusted", *prompt.stored);
    std::cout << theme::kv("Presented", prompt.presented);
    std::cout << theme::kv("Key type", prompt.algorithm);
    std::cout << "\n" << theme::step("Type 'accept new key' to trust it, anything else rejects:")
              << "    " << std::flush;
    auto answer = read_line();
    if (answer && *answer == "accept new key") return HostKeyDecision::AcceptNewKey;
    return HostKeyDecision::Reject;
}

std::optional<size_t> TerminalPrompter::choose_credential(const HostConfig& host,
                                                          const std::vector<Credential>& choices) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << theme::section("Credentials for " + host.display());
    for (size_t i = 0; i < choices.size(); i++) {
        std::cout << theme::color::HOST << fmt::format("    {:>2}  ", i + 1) << theme::color::RESET
                  << choices[i].label
                  << theme::dim(fmt::format("  ({})", credential_kind_name(choices[i].kind)))
                  << "\n";
    }
    std::cout << "\n" << theme::step("Number to use, empty to skip:") << "    " << std::flush;

    auto answer = read_line();
    if (!answer || answer->empty()) return std::nullopt;
    int n = safe_stoi(*answer, 0);
    if (n < 1 || static_cast<size_t>(n) > choices.size()) return std::nullopt;
    return static_cast<size_t>(n - 1);
}
