#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static int list_credentials(BaseCLI& cli, const HostConfig& host) {
    auto creds = cli.credentials->list(host.identity_key());
    std::cout << theme::section("Credentials for " + host.display());
    if (creds.empty()) {
        std::cout << theme::dim("    none stored") << "\n\n";
        return 0;
    }
    for (const auto& c : creds) {
        bool has_secret = cli.credentials->secret(host.identity_key(), c.id).has_value();
        std::string detail = credential_kind_name(c.kind);
        if (c.key_path) detail += " " + *c.key_path;
        if (!has_secret) detail += ", no saved secret";
        std::cout << fmt::format("    {}  {:<20} ", theme::host(c.id), c.label)
                  << theme::dim(detail) << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int add_credential(BaseCLI& cli, const HostConfig& host, const BaseCLI::Args& args) {
    std::optional<std::string> key_path;
    std::vector<std::string> rest;
    for (size_t i = 2; i < args.size(); i++) {
        if (args[i] == "--key" && i + 1 < args.size()) key_path = expand_path(args[++i]);
        else rest.push_back(args[i]);
    }
    if (rest.empty()) {
        cli.print_usage("credentials");
        return 1;
    }
    std::string label = rest[0];
    auto kind = key_path ? CredentialKind::PrivateKey : CredentialKind::Password;

    auto secret = cli.prompter->prompt_secret(key_path
        ? fmt::format("Passphrase for {} (empty for none)", *key_path)
        : fmt::format("Password for {}", host.display()));
    if (!secret) {
        std::cout << theme::fail("Cancelled.");
        return 1;
    }

    auto added = cli.credentials->add(host.identity_key(), label, kind, *secret, key_path);
    if (added.is_err()) {
        cli.report("Could not add credential", added.error, added.kind);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Added {} ({})", added.value.label, added.value.id));
    return 0;
}

static int do_credentials(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.empty()) {
        cli.print_usage("credentials");
        return 1;
    }
    auto host = cli.resolve_host(args[0]);
    if (!host) return 1;

    std::string action = args.size() > 1 ? args[1] : "list";
    if (action == "list") return list_credentials(cli, *host);
    if (action == "add") return add_credential(cli, *host, args);

    if (action == "remove" && args.size() > 2) {
        auto r = cli.credentials->remove(host->identity_key(), args[2]);
        if (r.is_err()) {
            cli.report("Could not remove credential", r.error, r.kind);
            return 1;
        }
        std::cout << theme::ok("Removed " + args[2]);
        return 0;
    }

    if (action == "forget-secrets") {
        cli.credentials->invalidate_secrets(host->identity_key());
        std::cout << theme::ok("Forgot saved secrets for " + host->display());
        return 0;
    }

    cli.print_usage("credentials");
    return 1;
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("credentials", do_credentials,
                    "<host> [list | add <label> [--key path] | remove <id> | forget-secrets]",
                    "Manage stored credentials");
}
