#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <ssh/shell_relay.hpp>
#include <platform/terminal.hpp>
#include <iostream>
#include <sstream>
#include <thread>
#include <atomic>
#include <cstdlib>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

static std::string join_args(const BaseCLI::Args& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); i++) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}

static int do_exec(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("exec");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto result = session->run(join_args(args, 1));
    if (result.is_err()) {
        cli.report("Command failed", result.error, result.kind);
        return 1;
    }
    std::cout << result.value.stdout_data << std::flush;
    if (!result.value.stderr_data.empty()) {
        std::cerr << result.value.stderr_data << std::flush;
    }
    return result.value.exit_code;
}

// ── search ─────────────────────────────────────────────────

static int do_search(BaseCLI& cli, const BaseCLI::Args& args) {
    SearchOptions options;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); i++) {
        const auto& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--name") options.content = false;
        else if (a == "--regex") options.regex = true;
        else if (a == "--case") options.case_sensitive = true;
        else if (a == "--include" && has_value) options.includes.push_back(args[++i]);
        else if (a == "--exclude" && has_value) options.excludes.push_back(args[++i]);
        else if (a == "--max" && has_value) options.max_results = safe_stoi(args[++i], -1);
        else positional.push_back(a);
    }
    if (positional.size() < 2) {
        cli.print_usage("search");
        return 1;
    }

    auto session = cli.require_session(positional[0]);
    if (!session) return 1;

    std::vector<std::string> roots(positional.begin() + 2, positional.end());
    if (roots.empty()) roots.push_back(cli.config->core().default_remote_path);

    // Ctrl-C cancels the search but keeps what was found
    CancelToken cancel;
    std::atomic<bool> finished{false};
    platform::install_interrupt_handler();
    std::thread watcher([&] {
        platform::wait_for_interrupt([&] { return finished.load(); });
        if (!finished.load()) cancel.cancel();
    });

    size_t streamed = 0;
    auto result = cli.search->search(*session, roots, positional[1], options, &cancel,
                                     [&](const SearchMatch&) { streamed++; });
    finished.store(true);
    watcher.join();

    if (result.is_err()) {
        cli.report("Search failed", result.error, result.kind);
        return 1;
    }

    for (const auto& m : result.value) {
        std::string where = m.line > 0 ? fmt::format("{}:{}", m.path, m.line) : m.path;
        std::cout << theme::host(where);
        if (!m.text.empty()) std::cout << "  " << m.text;
        if (m.file) {
            std::cout << theme::dim(fmt::format("  ({} bytes, {})", m.file->size,
                                                m.file->permissions));
        }
        std::cout << "\n";
    }

    if (cancel.is_cancelled()) {
        std::cout << theme::info(fmt::format("Cancelled after {} matches", streamed));
    } else {
        std::cout << theme::dim(fmt::format("    {} matches", result.value.size())) << "\n";
    }
    return 0;
}

// ── shell / repl ───────────────────────────────────────────

static int do_shell(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.empty()) {
        cli.print_usage("shell");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto size = platform::terminal_size();
    auto ch = session->open_shell(size.cols, size.rows);
    if (ch.is_err()) {
        cli.report("Could not open a shell", ch.error, ch.kind);
        return 1;
    }
    ShellRelay relay(std::move(ch.value));
    int status = relay.run();
    return status < 0 ? 0 : status;
}

static int do_repl(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.empty()) {
        cli.print_usage("repl");
        return 1;
    }
    auto host = cli.resolve_host(args[0]);
    if (!host) return 1;
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    std::cout << theme::banner();
    std::cout << theme::kv("Host", host->display());
    std::cout << theme::divider();
    std::cout << theme::dim("    Each line runs as a remote command. 'exit' to leave.") << "\n\n";

    // Readline uses \001 and \002 to wrap non-printing chars
    std::string prompt = theme::prompt(host->display());
    std::string identity = host->identity_key();

    std::string line;
    while (true) {
        char* raw = readline(prompt.c_str());
        if (!raw) break;  // EOF / Ctrl-D

        line = trimmed(raw);
        free(raw);
        if (line.empty()) continue;
        add_history(line.c_str());
        if (line == "exit" || line == "quit") break;

        // The registry may have swapped in a reconnected session
        auto current = cli.registry->get(identity);
        if (!current || !current->is_connected()) {
            if (cli.registry->is_reconnecting(identity)) {
                std::cout << theme::info("Reconnecting, try again in a moment.");
                continue;
            }
            current = cli.require_session(args[0]);
            if (!current) continue;
        }

        auto r = current->run(line);
        if (r.is_err()) {
            cli.report("Command failed", r.error, r.kind);
            continue;
        }
        std::cout << r.value.stdout_data;
        if (!r.value.stderr_data.empty()) std::cout << theme::red(r.value.stderr_data);
        if (r.value.failed()) std::cout << theme::dim(fmt::format("    exit {}", r.value.exit_code)) << "\n";
        std::cout << std::flush;
    }
    return 0;
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "<host> <command...>", "Run a command and print its output");
    cli.add_command("search", do_search,
                    "<host> <pattern> [root...] [--name] [--regex] [--case] "
                    "[--include glob] [--exclude glob] [--max n]",
                    "Search file contents or names");
    cli.add_command("shell", do_shell, "<host>", "Interactive login shell");
    cli.add_command("repl", do_repl, "<host>", "Command prompt that survives reconnects");
}
