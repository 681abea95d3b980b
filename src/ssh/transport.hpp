#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

// ── Authentication offer ───────────────────────────────────

enum class AuthMethod { PublicKey, Agent, Password, KeyboardInteractive };

const char* auth_method_name(AuthMethod method);

// Answers one keyboard-interactive prompt.
using KbdResponder = std::function<std::string(const std::string& prompt, bool echo)>;

struct AuthAttempt {
    AuthMethod method = AuthMethod::Password;
    std::string key_path;                   // PublicKey
    std::string secret;                     // password, or key passphrase
    KbdResponder responder;                 // KeyboardInteractive
};

// Secret obtained while building the offer, to be stored once it has worked.
struct PendingSecret {
    std::string credential_id;
    std::string slot;                       // "password", "passphrase" when credential_id is empty
    std::string value;
    bool ask_before_saving = false;
};

// Ordered list of methods the transport tries in sequence.
struct AuthOffer {
    std::vector<AuthAttempt> attempts;
    std::optional<std::string> credential_id;
    std::vector<PendingSecret> pending;

    bool empty() const { return attempts.empty(); }
};

// ── Host key check ─────────────────────────────────────────

struct PresentedHostKey {
    std::string address;
    int port = 22;
    std::string algorithm;
    std::string fingerprint;                // "SHA256:<base64>"
};

// Runs during negotiation; an error aborts the connect.
using HostKeyCheck = std::function<Result<void>(const PresentedHostKey&)>;

struct TransportOptions {
    int connect_timeout_ms = 10000;
    int keepalive_interval_ms = 30000;
};

// ── Channels ───────────────────────────────────────────────

enum class ChannelStatus { Open, Closed, Error };

// One multiplexed stream: an exec invocation, a shell, or a forwarded connection.
class Channel {
public:
    virtual ~Channel() = default;

    // Append whatever arrives within timeout_ms.  Closed once the remote side
    // has sent EOF and every buffered byte has been returned.
    virtual ChannelStatus poll(std::string& out, std::string* err, int timeout_ms) = 0;

    virtual Result<void> write(const std::string& data) = 0;
    virtual void send_eof() = 0;

    // Valid after poll() returned Closed; -1 if the server sent none.
    virtual int exit_status() = 0;

    // Deliver a signal ("TERM", "INT") to the remote process.
    virtual void signal(const std::string& name) = 0;

    // New window size for a PTY channel
    virtual void resize(int cols, int rows) = 0;

    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// ── File transfer subsystem ────────────────────────────────

struct SftpAttrs {
    uint64_t size = 0;
    int64_t mtime = 0;                      // seconds
    int64_t atime = 0;
    uint32_t permissions = 0;               // full st_mode
    bool is_dir = false;
    bool is_link = false;
};

struct SftpEntry {
    std::string name;
    std::string longname;                   // "ls -l" style line from the server
    SftpAttrs attrs;
};

// Return false to stop the transfer.
using ChunkSink = std::function<bool(const char* data, size_t len)>;

class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    virtual Result<std::vector<SftpEntry>> list(const std::string& path) = 0;
    virtual Result<SftpAttrs> stat(const std::string& path) = 0;
    virtual Result<std::string> realpath(const std::string& path) = 0;

    // Streams the file through sink in chunks of at most chunk_size bytes.
    // A sink returning false ends the transfer with ErrorKind::Cancelled.
    virtual Result<void> read(const std::string& path, size_t chunk_size,
                              const ChunkSink& sink) = 0;

    // Succeeds only after the server acknowledged closing the handle.
    virtual Result<void> write(const std::string& path, const std::string& data,
                               std::chrono::steady_clock::time_point deadline) = 0;

    virtual Result<void> mkdir(const std::string& path) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> unlink(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;

    virtual void close() = 0;
};

// ── Transport ──────────────────────────────────────────────

// One authenticated connection multiplexing every channel of a session.
class Transport {
public:
    using CloseHandler = std::function<void()>;

    virtual ~Transport() = default;

    // Connect, verify the host key through check, then authenticate with offer.
    virtual Result<void> open(const HostConfig& host, const AuthOffer& offer,
                              const HostKeyCheck& check, const TransportOptions& options) = 0;

    // Idempotent.  Fires the close handler if the transport was open.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Called at most once, after a successful open, when the connection ends
    // for any reason (close(), keepalive failure, socket hang-up).
    virtual void set_close_handler(CloseHandler handler) = 0;

    virtual Result<std::unique_ptr<Channel>> open_exec(const std::string& command) = 0;
    virtual Result<std::unique_ptr<Channel>> open_shell(int cols, int rows) = 0;
    virtual Result<std::unique_ptr<Channel>> open_direct_tcpip(const std::string& host, int port) = 0;
    virtual Result<std::unique_ptr<SftpChannel>> open_sftp() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
