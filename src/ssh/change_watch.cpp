#include "change_watch.hpp"
#include "shell_escape.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

const char* remote_os_name(RemoteOs os) {
    switch (os) {
        case RemoteOs::Linux:   return "linux";
        case RemoteOs::Darwin:  return "darwin";
        case RemoteOs::Windows: return "windows";
        case RemoteOs::Unknown: return "unknown";
    }
    return "unknown";
}

const char* watch_method_name(WatchMethod method) {
    switch (method) {
        case WatchMethod::Inotifywait: return "inotifywait";
        case WatchMethod::Fswatch:     return "fswatch";
        case WatchMethod::Poll:        return "poll";
    }
    return "poll";
}

// ── Capability probe ───────────────────────────────────────

RemoteOs parse_remote_os(const std::string& uname) {
    std::string s = trimmed(uname);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "linux") return RemoteOs::Linux;
    if (s == "darwin") return RemoteOs::Darwin;
    if (s.rfind("mingw", 0) == 0 || s.rfind("cygwin", 0) == 0 || s.rfind("msys", 0) == 0)
        return RemoteOs::Windows;
    return RemoteOs::Unknown;
}

WatchMethod choose_watch_method(const CapabilityProbe& probe) {
    if (probe.has_inotifywait) return WatchMethod::Inotifywait;
    if (probe.has_fswatch) return WatchMethod::Fswatch;
    return WatchMethod::Poll;
}

static bool tool_available(const ProbeRunner& run, const std::string& tool) {
    auto r = run(fmt::format("command -v {} >/dev/null 2>&1 && echo yes || echo no", tool));
    return r.is_ok() && trimmed(r.value.stdout_data) == "yes";
}

CapabilityProbe detect_capabilities(const ProbeRunner& run) {
    CapabilityProbe probe;

    auto uname = run("uname -s 2>/dev/null || echo unknown");
    if (uname.is_err()) {
        sshlite_log(fmt::format("Capability probe failed: {}", uname.error));
        return probe;
    }
    probe.os = parse_remote_os(uname.value.stdout_data);

    if (probe.os == RemoteOs::Linux) {
        probe.has_inotifywait = tool_available(run, "inotifywait");
    }
    if (probe.os == RemoteOs::Darwin || probe.os == RemoteOs::Unknown) {
        probe.has_fswatch = tool_available(run, "fswatch");
    }
    probe.method = choose_watch_method(probe);

    sshlite_log(fmt::format("Capabilities: os={} method={}",
                            remote_os_name(probe.os), watch_method_name(probe.method)));
    return probe;
}

std::optional<std::string> watch_command(WatchMethod method, const std::string& path) {
    switch (method) {
        case WatchMethod::Inotifywait:
            return RemoteCommand("inotifywait")
                .literal("-m")
                .literal("-e modify,delete_self,move_self")
                .arg(path)
                .quiet()
                .str();
        case WatchMethod::Fswatch:
            return RemoteCommand("fswatch")
                .literal("-x")
                .literal("--event Updated --event Removed --event Created")
                .arg(path)
                .quiet()
                .str();
        case WatchMethod::Poll:
            break;
    }
    return std::nullopt;
}

std::optional<FileChangeKind> parse_watch_line(WatchMethod method, const std::string& line) {
    std::string s = trimmed(line);
    if (s.empty()) return std::nullopt;

    if (method == WatchMethod::Inotifywait) {
        if (s.find("DELETE") != std::string::npos || s.find("MOVE_SELF") != std::string::npos)
            return FileChangeKind::Delete;
        if (s.find("CREATE") != std::string::npos) return FileChangeKind::Create;
        return FileChangeKind::Modify;
    }
    if (method == WatchMethod::Fswatch) {
        if (s.find("Removed") != std::string::npos) return FileChangeKind::Delete;
        if (s.find("Created") != std::string::npos) return FileChangeKind::Create;
        return FileChangeKind::Modify;
    }
    return std::nullopt;
}

// ── Broker ─────────────────────────────────────────────────

ChangeWatchBroker::ChangeWatchBroker(EventSink sink) : sink_(std::move(sink)) {}

ChangeWatchBroker::~ChangeWatchBroker() {
    unwatch_all();
}

void ChangeWatchBroker::join(const std::shared_ptr<Watcher>& w) {
    w->stop.store(true);
    if (!w->thread.joinable()) return;
    if (w->thread.get_id() == std::this_thread::get_id()) {
        w->thread.detach();
    } else {
        w->thread.join();
    }
}

void ChangeWatchBroker::reap_locked(std::vector<std::shared_ptr<Watcher>>& out) {
    for (auto it = watchers_.begin(); it != watchers_.end();) {
        if (it->second->finished.load()) {
            out.push_back(it->second);
            it = watchers_.erase(it);
        } else {
            ++it;
        }
    }
}

void ChangeWatchBroker::watch(const std::string& path, WatchMethod method,
                              std::unique_ptr<Channel> channel) {
    std::vector<std::shared_ptr<Watcher>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_locked(done);
        auto it = watchers_.find(path);
        if (it != watchers_.end()) {
            done.push_back(it->second);
            watchers_.erase(it);
        }
        auto w = std::make_shared<Watcher>();
        w->thread = std::thread(&ChangeWatchBroker::reader, this, w, path, method,
                                std::move(channel));
        watchers_[path] = w;
    }
    for (auto& w : done) join(w);
    sshlite_log(fmt::format("Watching {} via {}", path, watch_method_name(method)));
}

void ChangeWatchBroker::reader(std::shared_ptr<Watcher> w, std::string path,
                               WatchMethod method, std::unique_ptr<Channel> channel) {
    std::string buffer;
    while (!w->stop.load()) {
        auto status = channel->poll(buffer, nullptr, 200);

        size_t nl;
        while ((nl = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
            auto kind = parse_watch_line(method, line);
            if (kind && sink_ && !w->stop.load()) sink_(path, *kind);
        }

        if (status != ChannelStatus::Open) {
            sshlite_log(fmt::format("Watcher for {} ended ({})", path,
                                    status == ChannelStatus::Closed ? "exit" : "channel error"));
            break;
        }
    }
    channel->close();
    w->finished.store(true);
}

bool ChangeWatchBroker::unwatch(const std::string& path) {
    std::shared_ptr<Watcher> w;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watchers_.find(path);
        if (it == watchers_.end()) return false;
        w = it->second;
        watchers_.erase(it);
    }
    join(w);
    return true;
}

void ChangeWatchBroker::unwatch_all() {
    std::map<std::string, std::shared_ptr<Watcher>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(watchers_);
    }
    for (auto& [path, w] : all) join(w);
}

bool ChangeWatchBroker::is_watching(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watchers_.find(path);
    return it != watchers_.end() && !it->second->finished.load();
}

std::vector<std::string> ChangeWatchBroker::watched() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [path, w] : watchers_) {
        if (!w->finished.load()) out.push_back(path);
    }
    return out;
}
