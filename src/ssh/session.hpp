#pragma once

#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <optional>
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/events.hpp>
#include <core/cancel.hpp>
#include "transport.hpp"
#include "auth.hpp"
#include "host_verifier.hpp"
#include "change_watch.hpp"
#include "port_forwarder.hpp"

struct SessionStateEvent {
    std::string identity;
    ConnectionState state = ConnectionState::Disconnected;
    std::string error;                      // set for ConnectionState::Error
};

// Services a session borrows.  All of them outlive every session.
struct SessionDeps {
    TransportFactory transport_factory;
    AuthResolver& auth;
    HostIdentityVerifier& verifier;
    const SshLiteConfig& config;
};

// received bytes, total bytes (0 if unknown)
using ProgressCallback = std::function<void(uint64_t received, uint64_t total)>;

// One host+port+user.  Owns a single multiplexed transport, the lazily opened
// SFTP sub-channel, watcher channels and port forwards.
//
// Always create through std::make_shared: the transport's close notification
// reaches the session through a weak reference.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(HostConfig host, std::optional<Credential> credential, SessionDeps deps);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return identity_; }
    const HostConfig& host() const { return host_; }
    const std::optional<Credential>& credential() const { return credential_; }
    ConnectionState state() const;
    bool is_connected() const { return state() == ConnectionState::Connected; }

    // ── Lifecycle ───────────────────────────────────────────

    // No-op when already connected.  Valid again after Error or Disconnected.
    Result<void> connect();

    // SFTP sub-channel, then forwards and watchers, then the transport.
    void disconnect();

    // ── Commands ────────────────────────────────────────────

    // Exit code and both streams, whatever the exit code.
    Result<SSHResult> run(const std::string& command, const CancelToken* cancel = nullptr);

    // stdout of a command that exited 0; Transfer error carrying stderr otherwise.
    Result<std::string> exec(const std::string& command);

    Result<std::unique_ptr<Channel>> open_exec_channel(const std::string& command);
    Result<std::unique_ptr<Channel>> open_shell(int cols, int rows);

    // ── Files ───────────────────────────────────────────────

    // "~" lists the login directory.  Directories first, then by name.
    Result<std::vector<RemoteFile>> list_files(const std::string& path);
    Result<RemoteFile> stat(const std::string& path);
    Result<std::string> read_file(const std::string& path);
    Result<std::string> read_file_chunked(const std::string& path, ProgressCallback on_progress,
                                          const CancelToken* cancel,
                                          size_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Resolves once the server confirmed the close, or fails with Timeout.
    Result<void> write_file(const std::string& path, const std::string& content);

    Result<void> mkdir(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);
    Result<void> delete_file(const std::string& path);

    // Bytes after offset, via tail on the remote
    Result<std::string> read_file_tail(const std::string& path, uint64_t offset);
    Result<std::string> read_file_first_lines(const std::string& path, int lines);
    Result<std::string> read_file_last_lines(const std::string& path, int lines);

    // ── Change notification ─────────────────────────────────

    // nullopt until the probe of the current transport has finished
    std::optional<CapabilityProbe> capabilities() const;
    std::optional<CapabilityProbe> wait_for_capabilities(std::chrono::milliseconds timeout);

    // False when only polling is possible; the caller then polls stat() itself.
    bool watch_file(const std::string& path);
    bool unwatch_file(const std::string& path);
    void unwatch_all();
    bool is_watching(const std::string& path);

    // ── Port forwarding ─────────────────────────────────────

    Result<void> forward_port(int local_port, const std::string& remote_host, int remote_port);
    bool stop_forward(int local_port);
    std::vector<ForwardInfo> active_forwards();

    // ── Events ──────────────────────────────────────────────

    EventChannel<SessionStateEvent>& state_changed() { return state_changed_; }
    EventChannel<FileChangeEvent>& file_changed() { return file_changed_; }

private:
    HostConfig host_;
    std::optional<Credential> credential_;
    SessionDeps deps_;
    std::string identity_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::shared_ptr<Transport> transport_;
    uint64_t generation_ = 0;               // bumped per connect attempt
    uint64_t closed_generation_ = 0;        // last generation whose close was handled
    std::shared_ptr<SftpChannel> sftp_;
    std::optional<CapabilityProbe> caps_;
    std::condition_variable caps_cv_;

    std::mutex connect_mutex_;              // one connect() at a time
    std::timed_mutex sftp_mutex_;           // one SFTP request at a time
    std::thread probe_thread_;

    ChangeWatchBroker watchers_;
    PortForwarder forwarder_;

    EventChannel<SessionStateEvent> state_changed_;
    EventChannel<FileChangeEvent> file_changed_;

    std::shared_ptr<Transport> live_transport();
    Result<std::shared_ptr<SftpChannel>> acquire_sftp();
    void on_transport_closed(uint64_t generation);
    void release_sftp();
    void set_state(ConnectionState state, const std::string& error = "");
    void start_probe(uint64_t generation);
    void join_probe();
    std::string context(const std::string& what, const std::string& path) const;
    RemoteFile to_remote_file(const std::string& name, const std::string& path,
                              const SftpAttrs& attrs, const std::string& longname) const;
};
