#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <chrono>
#include <iostream>
#include <fmt/format.h>

// ── forward ────────────────────────────────────────────────

static int do_forward(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 3) {
        cli.print_usage("forward");
        return 1;
    }
    int local_port = safe_stoi(args[1], -1);

    // [remote_host:]remote_port
    std::string remote_host = "localhost";
    std::string target = args[2];
    auto colon = target.rfind(':');
    if (colon != std::string::npos) {
        remote_host = target.substr(0, colon);
        target = target.substr(colon + 1);
    }
    int remote_port = safe_stoi(target, -1);

    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto r = session->forward_port(local_port, remote_host, remote_port);
    if (r.is_err()) {
        cli.report("Forward failed", r.error, r.kind);
        return 1;
    }
    std::cout << theme::ok(fmt::format("127.0.0.1:{} -> {}:{} via {}", local_port,
                                       remote_host, remote_port, session->host().display()));
    std::cout << theme::step("Ctrl-C to stop.");

    // Forwards belong to a session; re-open them on the reconnected one
    std::string identity = session->id();
    platform::install_interrupt_handler();
    while (!platform::interrupted()) {
        platform::sleep_ms(200);
        auto current = cli.registry->get(identity);
        if (!current || current == session || !current->is_connected()) continue;

        session->stop_forward(local_port);
        session = current;
        auto again = session->forward_port(local_port, remote_host, remote_port);
        if (again.is_err()) {
            cli.report("Forward could not be restored", again.error, again.kind);
            return 1;
        }
        std::cout << theme::ok(fmt::format("Forward on port {} restored", local_port));
    }
    session->stop_forward(local_port);
    std::cout << "\n";
    return 0;
}

// ── status / disconnect ────────────────────────────────────

static int do_status(BaseCLI& cli, const BaseCLI::Args& args) {
    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults");
    }

    const auto& hosts = cli.config->hosts();
    if (hosts.empty()) {
        std::cout << theme::dim("    No named hosts configured") << "\n";
    }
    for (const auto& h : hosts) {
        auto trusted = cli.verifier->trusted(h.address, h.port);
        std::cout << theme::kv(h.name, fmt::format("{}  {}", h.display(),
                                                   trusted ? "trusted" : "unknown key"));
    }

    // With a host argument, also report a live connection attempt
    if (!args.empty()) {
        auto session = cli.require_session(args[0]);
        std::cout << "\n";
        if (!session) return 1;
        std::cout << theme::kv("Session", session->host().display());
        std::cout << theme::kv("State", theme::state(session->state()));
        auto caps = session->wait_for_capabilities(std::chrono::seconds(5));
        if (caps) std::cout << theme::kv("Watching", watch_method_name(caps->method));
    }
    std::cout << "\n";
    return 0;
}

// ── trust ──────────────────────────────────────────────────

static int do_trust_forget(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.empty()) {
        cli.print_usage("trust-forget");
        return 1;
    }
    auto host = cli.resolve_host(args[0]);
    if (!host) return 1;

    auto r = cli.verifier->forget(host->address, host->port);
    if (r.is_err()) {
        cli.report("Could not forget host key", r.error, r.kind);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Forgot the host key for {}:{}", host->address, host->port));
    return 0;
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("forward", do_forward, "<host> <local_port> [remote_host:]remote_port",
                    "Forward a local port through the host");
    cli.add_command("status", do_status, "[host]", "Show configured hosts, trust and a live session");
    cli.add_command("trust-forget", do_trust_forget, "<host>",
                    "Forget a trusted or rejected host key");
}
