#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <map>
#include <mutex>
#include <fmt/format.h>

static std::string human_size(uint64_t bytes) {
    if (bytes < 1024) return fmt::format("{}", bytes);
    double v = static_cast<double>(bytes);
    const char* units[] = {"K", "M", "G", "T"};
    int u = -1;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        u++;
    }
    return fmt::format("{:.1f}{}", v, units[u]);
}

static std::string path_arg(BaseCLI& cli, const BaseCLI::Args& args, size_t i) {
    return i < args.size() ? args[i] : cli.config->core().default_remote_path;
}

// ── ls / cat / head / tail ─────────────────────────────────

static int do_ls(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.empty()) {
        cli.print_usage("ls");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto files = session->list_files(path_arg(cli, args, 1));
    if (files.is_err()) {
        cli.report("Listing failed", files.error, files.kind);
        return 1;
    }

    for (const auto& f : files.value) {
        std::string type = f.is_directory ? "d" : (f.is_link ? "l" : "-");
        std::string name = f.is_directory ? theme::host(f.name + "/") : f.name;
        std::cout << fmt::format("  {}{} {:<8} {:<8} {:>7}  ", type, f.permissions,
                                 f.owner, f.group, human_size(f.size))
                  << name << "\n";
    }
    return 0;
}

static int do_cat(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("cat");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    // Progress goes to stderr so stdout stays pipeable
    bool show_progress = platform::is_tty();
    auto result = session->read_file_chunked(args[1], [&](uint64_t received, uint64_t total) {
        if (!show_progress || total == 0) return;
        std::cerr << fmt::format("\r  {} / {}", human_size(received), human_size(total))
                  << std::flush;
    }, nullptr);
    if (show_progress) std::cerr << "\r\033[K" << std::flush;

    if (result.is_err()) {
        cli.report("Read failed", result.error, result.kind);
        return 1;
    }
    std::cout << result.value << std::flush;
    return 0;
}

static int do_head(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("head");
        return 1;
    }
    int lines = args.size() > 2 ? safe_stoi(args[2], 10) : 10;
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto result = session->read_file_first_lines(args[1], lines);
    if (result.is_err()) {
        cli.report("Read failed", result.error, result.kind);
        return 1;
    }
    std::cout << result.value << std::flush;
    return 0;
}

static int do_tail(BaseCLI& cli, const BaseCLI::Args& args) {
    bool follow = false;
    std::vector<std::string> positional;
    for (const auto& a : args) {
        if (a == "-f" || a == "--follow") follow = true;
        else positional.push_back(a);
    }
    if (positional.size() < 2) {
        cli.print_usage("tail");
        return 1;
    }
    int lines = positional.size() > 2 ? safe_stoi(positional[2], 10) : 10;
    const std::string& path = positional[1];

    auto session = cli.require_session(positional[0]);
    if (!session) return 1;

    auto result = session->read_file_last_lines(path, lines);
    if (result.is_err()) {
        cli.report("Read failed", result.error, result.kind);
        return 1;
    }
    std::cout << result.value << std::flush;
    if (!follow) return 0;

    auto st = session->stat(path);
    if (st.is_err()) {
        cli.report("Stat failed", st.error, st.kind);
        return 1;
    }
    uint64_t offset = st.value.size;
    std::string identity = session->id();

    platform::install_interrupt_handler();
    while (!platform::interrupted()) {
        platform::sleep_ms(1000);
        auto current = cli.registry->get(identity);
        if (!current || !current->is_connected()) continue;

        auto chunk = current->read_file_tail(path, offset);
        if (chunk.is_err()) continue;
        if (chunk.value.empty()) continue;
        std::cout << chunk.value << std::flush;
        offset += chunk.value.size();
    }
    std::cout << "\n";
    return 0;
}

// ── put / mkdir / rm / mv ──────────────────────────────────

static int do_put(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 3) {
        cli.print_usage("put");
        return 1;
    }
    std::ifstream in(args[1], std::ios::binary);
    if (!in) {
        std::cout << theme::fail("Cannot read " + args[1]);
        return 1;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto result = session->write_file(args[2], ss.str());
    if (result.is_err()) {
        cli.report("Upload failed", result.error, result.kind);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Wrote {} to {}", human_size(ss.str().size()), args[2]));
    return 0;
}

static int do_mkdir(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("mkdir");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto result = session->mkdir(args[1]);
    if (result.is_err()) {
        cli.report("mkdir failed", result.error, result.kind);
        return 1;
    }
    return 0;
}

static int do_rm(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("rm");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    for (size_t i = 1; i < args.size(); i++) {
        auto result = session->delete_file(args[i]);
        if (result.is_err()) {
            cli.report("Delete failed", result.error, result.kind);
            return 1;
        }
    }
    return 0;
}

static int do_mv(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 3) {
        cli.print_usage("mv");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;

    auto result = session->rename(args[1], args[2]);
    if (result.is_err()) {
        cli.report("Rename failed", result.error, result.kind);
        return 1;
    }
    return 0;
}

// ── watch ──────────────────────────────────────────────────

namespace {

// Keeps a set of watches alive on whichever session the registry currently
// holds for a host.  Paths the remote cannot stream are polled with stat().
class WatchFollower {
public:
    explicit WatchFollower(std::vector<std::string> paths) : paths_(std::move(paths)) {}

    ~WatchFollower() { detach(); }

    void attach(const std::shared_ptr<Session>& session) {
        detach();
        session_ = session;
        sub_ = session->file_changed().subscribe([](const FileChangeEvent& ev) {
            print(ev.kind, ev.path);
        });

        std::lock_guard<std::mutex> lock(mutex_);
        polled_.clear();
        for (const auto& p : paths_) {
            if (session->watch_file(p)) continue;
            auto st = session->stat(p);
            polled_[p] = st.is_ok() ? std::optional<RemoteFile>(st.value) : std::nullopt;
        }
        if (!polled_.empty()) {
            std::cout << theme::dim(fmt::format("    Polling {} path(s); no remote watcher available",
                                                polled_.size())) << "\n";
        }
    }

    void poll() {
        if (!session_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [path, last] : polled_) {
            auto st = session_->stat(path);
            if (st.is_err()) {
                if (last && st.kind != ErrorKind::NotConnected && !is_connection_error(st.kind)) {
                    print(FileChangeKind::Delete, path);
                    last.reset();
                }
                continue;
            }
            if (!last) {
                print(FileChangeKind::Create, path);
            } else if (st.value.modified_ms != last->modified_ms || st.value.size != last->size) {
                print(FileChangeKind::Modify, path);
            }
            last = st.value;
        }
    }

    const std::shared_ptr<Session>& session() const { return session_; }

private:
    static void print(FileChangeKind kind, const std::string& path) {
        std::cout << theme::log(fmt::format("{:<7} {}", file_change_kind_name(kind), path))
                  << std::flush;
    }

    void detach() {
        if (!session_) return;
        session_->file_changed().unsubscribe(sub_);
        for (const auto& p : paths_) session_->unwatch_file(p);
        session_.reset();
    }

    std::vector<std::string> paths_;
    std::shared_ptr<Session> session_;
    EventChannel<FileChangeEvent>::SubscriptionId sub_ = 0;
    std::mutex mutex_;
    std::map<std::string, std::optional<RemoteFile>> polled_;
};

} // namespace

static int do_watch(BaseCLI& cli, const BaseCLI::Args& args) {
    if (args.size() < 2) {
        cli.print_usage("watch");
        return 1;
    }
    auto session = cli.require_session(args[0]);
    if (!session) return 1;
    std::string identity = session->id();

    WatchFollower follower(BaseCLI::Args(args.begin() + 1, args.end()));
    follower.attach(session);
    std::cout << theme::step(fmt::format("Watching {} path(s) on {}. Ctrl-C to stop.",
                                         args.size() - 1, session->host().display()));

    platform::install_interrupt_handler();
    int64_t last_poll = now_ms();
    while (!platform::interrupted()) {
        platform::sleep_ms(200);

        // Re-arm on the replacement session after a reconnect
        auto current = cli.registry->get(identity);
        if (current && current != follower.session() && current->is_connected()) {
            follower.attach(current);
        }
        if (now_ms() - last_poll >= 2000) {
            follower.poll();
            last_poll = now_ms();
        }
    }
    std::cout << "\n";
    return 0;
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "<host> [path]", "List a remote directory");
    cli.add_command("cat", do_cat, "<host> <path>", "Print a remote file");
    cli.add_command("head", do_head, "<host> <path> [lines]", "First lines of a remote file");
    cli.add_command("tail", do_tail, "<host> <path> [lines] [-f]", "Last lines, optionally following");
    cli.add_command("put", do_put, "<host> <local> <remote>", "Upload a local file");
    cli.add_command("mkdir", do_mkdir, "<host> <path>", "Create a remote directory");
    cli.add_command("rm", do_rm, "<host> <path...>", "Delete remote files or empty directories");
    cli.add_command("mv", do_mv, "<host> <from> <to>", "Rename a remote path");
    cli.add_command("watch", do_watch, "<host> <path...>", "Print changes to remote files");
}
