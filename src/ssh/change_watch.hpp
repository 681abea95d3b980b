#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include "transport.hpp"

// ── Capability probe ───────────────────────────────────────

enum class RemoteOs { Linux, Darwin, Windows, Unknown };
enum class WatchMethod { Inotifywait, Fswatch, Poll };

const char* remote_os_name(RemoteOs os);
const char* watch_method_name(WatchMethod method);

struct CapabilityProbe {
    RemoteOs os = RemoteOs::Unknown;
    bool has_inotifywait = false;
    bool has_fswatch = false;
    WatchMethod method = WatchMethod::Poll;
};

// Runs one remote command; used so the probe can be driven by any session.
using ProbeRunner = std::function<Result<SSHResult>(const std::string& command)>;

// "Linux" -> Linux, "Darwin" -> Darwin, MINGW/CYGWIN/MSYS -> Windows.
RemoteOs parse_remote_os(const std::string& uname);

// inotifywait beats fswatch beats polling.
WatchMethod choose_watch_method(const CapabilityProbe& probe);

// Never fails: any probe error degrades to RemoteOs::Unknown / WatchMethod::Poll.
CapabilityProbe detect_capabilities(const ProbeRunner& run);

// Remote command that prints one line per change; nullopt for Poll.
std::optional<std::string> watch_command(WatchMethod method, const std::string& path);

// Normalize one output line of the watch tool.
std::optional<FileChangeKind> parse_watch_line(WatchMethod method, const std::string& line);

// ── Broker ─────────────────────────────────────────────────

// Owns one long-lived exec channel per watched path and turns its output
// into change events.  Each channel is drained by its own reader thread,
// which is also the only thread that touches the channel.
class ChangeWatchBroker {
public:
    using EventSink = std::function<void(const std::string& path, FileChangeKind kind)>;

    explicit ChangeWatchBroker(EventSink sink);
    ~ChangeWatchBroker();

    ChangeWatchBroker(const ChangeWatchBroker&) = delete;
    ChangeWatchBroker& operator=(const ChangeWatchBroker&) = delete;

    // Takes ownership of an exec channel already running watch_command().
    void watch(const std::string& path, WatchMethod method, std::unique_ptr<Channel> channel);

    bool unwatch(const std::string& path);
    void unwatch_all();

    // False once the watch tool exited on its own.
    bool is_watching(const std::string& path);
    std::vector<std::string> watched();

private:
    struct Watcher {
        std::atomic<bool> stop{false};
        std::atomic<bool> finished{false};
        std::thread thread;
    };

    EventSink sink_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Watcher>> watchers_;

    void reader(std::shared_ptr<Watcher> w, std::string path, WatchMethod method,
                std::unique_ptr<Channel> channel);
    void reap_locked(std::vector<std::shared_ptr<Watcher>>& out);
    static void join(const std::shared_ptr<Watcher>& w);
};
