#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <mutex>

using Clock = std::chrono::steady_clock;

static Clock::time_point deadline_in(int ms) {
    return Clock::now() + std::chrono::milliseconds(ms);
}

static void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) sshlite_log(fmt::format("libssh2_init failed: {}", rc));
    });
}

// ── I/O helpers ───────────────────────────────────────────

// Wait (briefly) for the socket in the direction libssh2 is blocked on.
static void wait_socket(SshHandle& h, int timeout_ms) {
    int dir;
    {
        std::lock_guard<std::mutex> lock(h.io);
        dir = h.session ? libssh2_session_block_directions(h.session) : 0;
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0 || h.sock == SSHLITE_INVALID_SOCKET) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    platform::poll_socket(h.sock, events, timeout_ms);
}

// Run fn under the io lock until it stops returning EAGAIN.
template <typename Fn>
static int io_retry(SshHandle& h, Clock::time_point deadline, Fn&& fn) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(h.io);
            rc = static_cast<int>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (h.closed.load()) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        wait_socket(h, 10);
    }
}

// Same, for calls that signal EAGAIN through a null return.
template <typename T, typename Fn>
static T* io_retry_ptr(SshHandle& h, Clock::time_point deadline, Fn&& fn) {
    while (true) {
        T* p;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(h.io);
            p = fn();
            if (!p) err = libssh2_session_last_errno(h.session);
        }
        if (p) return p;
        if (err != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (h.closed.load() || Clock::now() >= deadline) return nullptr;
        wait_socket(h, 10);
    }
}

static std::string last_error(SshHandle& h) {
    std::lock_guard<std::mutex> lock(h.io);
    if (!h.session) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(h.session, &msg, &len, 0);
    return msg ? std::string(msg, len) : "unknown error";
}

static ErrorKind kind_for_rc(SshHandle& h, int rc) {
    if (h.closed.load() || rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_SOCKET_SEND) {
        return ErrorKind::NotConnected;
    }
    if (rc == LIBSSH2_ERROR_TIMEOUT) return ErrorKind::Timeout;
    return ErrorKind::Transfer;
}

static void free_channel(SshHandle& h, LIBSSH2_CHANNEL* ch) {
    if (!ch) return;
    if (!h.closed.load()) {
        auto deadline = deadline_in(2000);
        io_retry(h, deadline, [&] { return libssh2_channel_close(ch); });
    }
    std::lock_guard<std::mutex> lock(h.io);
    libssh2_channel_free(ch);
}

// ── SshHandle ─────────────────────────────────────────────

SshHandle::~SshHandle() {
    if (session) {
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != SSHLITE_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = SSHLITE_INVALID_SOCKET;
    }
}

// ── Channel ───────────────────────────────────────────────

class Libssh2Channel : public Channel {
public:
    Libssh2Channel(std::shared_ptr<SshHandle> h, LIBSSH2_CHANNEL* ch)
        : h_(std::move(h)), ch_(ch) {}

    ~Libssh2Channel() override { close(); }

    ChannelStatus poll(std::string& out, std::string* err, int timeout_ms) override {
        if (!ch_ || eof_) return ChannelStatus::Closed;
        auto deadline = deadline_in(timeout_ms);
        char buf[SSH_READ_BUF_SIZE];

        while (true) {
            if (h_->closed.load()) return ChannelStatus::Error;

            ssize_t n_out, n_err;
            bool got = false;
            bool eof = false;
            {
                std::lock_guard<std::mutex> lock(h_->io);
                n_out = libssh2_channel_read(ch_, buf, sizeof(buf));
                if (n_out > 0) {
                    out.append(buf, static_cast<size_t>(n_out));
                    got = true;
                }
                // Always drain stderr so the window never stalls on it
                n_err = libssh2_channel_read_stderr(ch_, buf, sizeof(buf));
                if (n_err > 0) {
                    if (err) err->append(buf, static_cast<size_t>(n_err));
                    got = true;
                }
                if (!got && libssh2_channel_eof(ch_)) {
                    eof = true;
                    exit_status_ = libssh2_channel_get_exit_status(ch_);
                }
            }

            if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
                (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
                return ChannelStatus::Error;
            }
            if (got) return ChannelStatus::Open;
            if (eof) {
                eof_ = true;
                return ChannelStatus::Closed;
            }
            if (Clock::now() >= deadline) return ChannelStatus::Open;
            wait_socket(*h_, 10);
        }
    }

    Result<void> write(const std::string& data) override {
        if (!ch_) return Result<void>::Err("Channel is closed", ErrorKind::NotConnected);
        size_t sent = 0;
        auto deadline = deadline_in(CHANNEL_OPEN_TIMEOUT_MS);
        while (sent < data.size()) {
            int w = io_retry(*h_, deadline, [&] {
                return libssh2_channel_write(ch_, data.data() + sent, data.size() - sent);
            });
            if (w < 0) {
                return Result<void>::Err("Channel write failed: " + last_error(*h_),
                                         kind_for_rc(*h_, w));
            }
            sent += static_cast<size_t>(w);
        }
        return Result<void>::Ok();
    }

    void send_eof() override {
        if (!ch_) return;
        io_retry(*h_, deadline_in(2000), [&] { return libssh2_channel_send_eof(ch_); });
    }

    int exit_status() override { return exit_status_; }

    void signal(const std::string& name) override {
        if (!ch_ || h_->closed.load()) return;
#if LIBSSH2_VERSION_NUM >= 0x010b00
        int rc = io_retry(*h_, deadline_in(2000), [&] {
            return libssh2_channel_signal_ex(ch_, name.c_str(), name.size());
        });
        if (rc != 0) sshlite_log(fmt::format("Channel: signal {} failed ({})", name, rc));
#else
        sshlite_log(fmt::format("Channel: libssh2 too old to send signal {}", name));
#endif
    }

    void resize(int cols, int rows) override {
        if (!ch_ || h_->closed.load()) return;
        io_retry(*h_, deadline_in(2000), [&] {
            return libssh2_channel_request_pty_size(ch_, cols, rows);
        });
    }

    void close() override {
        if (!ch_) return;
        free_channel(*h_, ch_);
        ch_ = nullptr;
    }

    bool is_closed() const override { return ch_ == nullptr || eof_; }

private:
    std::shared_ptr<SshHandle> h_;
    LIBSSH2_CHANNEL* ch_;
    bool eof_ = false;
    int exit_status_ = -1;
};

// ── SFTP ──────────────────────────────────────────────────

static std::string sftp_status_text(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:         return "No such file or directory";
        case LIBSSH2_FX_PERMISSION_DENIED:    return "Permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:  return "File already exists";
        case LIBSSH2_FX_DIR_NOT_EMPTY:        return "Directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:      return "Not a directory";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:       return "No space left";
        case LIBSSH2_FX_OP_UNSUPPORTED:       return "Operation not supported";
        default:                              return fmt::format("SFTP failure ({})", code);
    }
}

static SftpAttrs to_attrs(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    SftpAttrs out;
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) out.size = a.filesize;
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.mtime = static_cast<int64_t>(a.mtime);
        out.atime = static_cast<int64_t>(a.atime);
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.permissions = static_cast<uint32_t>(a.permissions);
        out.is_dir = (a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        out.is_link = (a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK;
    }
    return out;
}

class Libssh2Sftp : public SftpChannel {
public:
    Libssh2Sftp(std::shared_ptr<SshHandle> h, LIBSSH2_SFTP* sftp)
        : h_(std::move(h)), sftp_(sftp) {}

    ~Libssh2Sftp() override { close(); }

    Result<std::vector<SftpEntry>> list(const std::string& path) override {
        using R = Result<std::vector<SftpEntry>>;
        if (!sftp_) return R::Err("SFTP session closed", ErrorKind::NotConnected);
        auto deadline = deadline_in(CHANNEL_OPEN_TIMEOUT_MS);

        LIBSSH2_SFTP_HANDLE* dir = io_retry_ptr<LIBSSH2_SFTP_HANDLE>(*h_, deadline, [&] {
            return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        0, 0, LIBSSH2_SFTP_OPENDIR);
        });
        if (!dir) return R::Err(error_for(LIBSSH2_ERROR_SFTP_PROTOCOL), kind());

        std::vector<SftpEntry> out;
        char filename[512];
        char longentry[1024];
        while (true) {
            LIBSSH2_SFTP_ATTRIBUTES attrs;
            std::memset(&attrs, 0, sizeof(attrs));
            int rc = io_retry(*h_, deadline, [&] {
                return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
            });
            if (rc == 0) break;
            if (rc < 0) {
                std::string err = error_for(rc);
                close_handle(dir);
                return R::Err(err, kind_for_rc(*h_, rc));
            }
            SftpEntry e;
            e.name.assign(filename, static_cast<size_t>(rc));
            e.longname = longentry;
            e.attrs = to_attrs(attrs);
            out.push_back(std::move(e));
        }
        close_handle(dir);
        return R::Ok(std::move(out));
    }

    Result<SftpAttrs> stat(const std::string& path) override {
        if (!sftp_) return Result<SftpAttrs>::Err("SFTP session closed", ErrorKind::NotConnected);
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = io_retry(*h_, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), [&] {
            return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        LIBSSH2_SFTP_STAT, &attrs);
        });
        if (rc != 0) return Result<SftpAttrs>::Err(error_for(rc), kind_for_rc(*h_, rc));
        return Result<SftpAttrs>::Ok(to_attrs(attrs));
    }

    Result<std::string> realpath(const std::string& path) override {
        if (!sftp_) return Result<std::string>::Err("SFTP session closed", ErrorKind::NotConnected);
        char buf[4096];
        int rc = io_retry(*h_, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), [&] {
            return libssh2_sftp_symlink_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                           buf, sizeof(buf), LIBSSH2_SFTP_REALPATH);
        });
        if (rc < 0) return Result<std::string>::Err(error_for(rc), kind_for_rc(*h_, rc));
        return Result<std::string>::Ok(std::string(buf, static_cast<size_t>(rc)));
    }

    Result<void> read(const std::string& path, size_t chunk_size, const ChunkSink& sink) override {
        if (!sftp_) return Result<void>::Err("SFTP session closed", ErrorKind::NotConnected);
        auto deadline = deadline_in(CHANNEL_OPEN_TIMEOUT_MS);
        LIBSSH2_SFTP_HANDLE* fh = io_retry_ptr<LIBSSH2_SFTP_HANDLE>(*h_, deadline, [&] {
            return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
        });
        if (!fh) return Result<void>::Err(error_for(LIBSSH2_ERROR_SFTP_PROTOCOL), kind());

        std::vector<char> buf(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE);
        while (true) {
            // Deadline applies to stalls, not to the whole transfer
            int n = io_retry(*h_, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), [&] {
                return libssh2_sftp_read(fh, buf.data(), buf.size());
            });
            if (n == 0) break;
            if (n < 0) {
                std::string err = error_for(n);
                close_handle(fh);
                return Result<void>::Err(err, kind_for_rc(*h_, n));
            }
            if (!sink(buf.data(), static_cast<size_t>(n))) {
                close_handle(fh);
                return Result<void>::Err("Transfer cancelled", ErrorKind::Cancelled);
            }
        }
        close_handle(fh);
        return Result<void>::Ok();
    }

    Result<void> write(const std::string& path, const std::string& data,
                       Clock::time_point deadline) override {
        if (!sftp_) return Result<void>::Err("SFTP session closed", ErrorKind::NotConnected);
        LIBSSH2_SFTP_HANDLE* fh = io_retry_ptr<LIBSSH2_SFTP_HANDLE>(*h_, deadline, [&] {
            return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                        0644, LIBSSH2_SFTP_OPENFILE);
        });
        if (!fh) {
            if (Clock::now() >= deadline) {
                return Result<void>::Err("Timed out opening " + path, ErrorKind::Timeout);
            }
            return Result<void>::Err(error_for(LIBSSH2_ERROR_SFTP_PROTOCOL), kind());
        }

        size_t sent = 0;
        while (sent < data.size()) {
            int w = io_retry(*h_, deadline, [&] {
                return libssh2_sftp_write(fh, data.data() + sent, data.size() - sent);
            });
            if (w < 0) {
                // Handle is abandoned on timeout; the server reclaims it on disconnect
                if (w == LIBSSH2_ERROR_TIMEOUT) {
                    return Result<void>::Err("Server did not accept data in time", ErrorKind::Timeout);
                }
                std::string err = error_for(w);
                close_handle(fh);
                return Result<void>::Err(err, kind_for_rc(*h_, w));
            }
            sent += static_cast<size_t>(w);
        }

        int frc = io_retry(*h_, deadline, [&] { return libssh2_sftp_fsync(fh); });
        if (frc != 0 && frc != LIBSSH2_ERROR_TIMEOUT) {
            // fsync@openssh.com is optional; the close below is the real confirmation
            sshlite_log(fmt::format("SFTP: fsync unsupported or failed for {} ({})", path, frc));
        }

        int crc = io_retry(*h_, deadline, [&] { return libssh2_sftp_close_handle(fh); });
        if (crc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err("Server did not confirm closing " + path, ErrorKind::Timeout);
        }
        if (crc != 0) return Result<void>::Err(error_for(crc), kind_for_rc(*h_, crc));
        return Result<void>::Ok();
    }

    Result<void> mkdir(const std::string& path) override {
        return simple("mkdir", [&] {
            return libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()), 0755);
        });
    }

    Result<void> rmdir(const std::string& path) override {
        return simple("rmdir", [&] {
            return libssh2_sftp_rmdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
        });
    }

    Result<void> unlink(const std::string& path) override {
        return simple("unlink", [&] {
            return libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
        });
    }

    Result<void> rename(const std::string& from, const std::string& to) override {
        return simple("rename", [&] {
            return libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                                          to.c_str(), static_cast<unsigned>(to.size()),
                                          LIBSSH2_SFTP_RENAME_OVERWRITE |
                                          LIBSSH2_SFTP_RENAME_ATOMIC |
                                          LIBSSH2_SFTP_RENAME_NATIVE);
        });
    }

    void close() override {
        if (!sftp_) return;
        if (!h_->closed.load()) {
            io_retry(*h_, deadline_in(2000), [&] { return libssh2_sftp_shutdown(sftp_); });
        }
        sftp_ = nullptr;
    }

private:
    std::shared_ptr<SshHandle> h_;
    LIBSSH2_SFTP* sftp_;

    template <typename Fn>
    Result<void> simple(const char* op, Fn&& fn) {
        if (!sftp_) return Result<void>::Err("SFTP session closed", ErrorKind::NotConnected);
        int rc = io_retry(*h_, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), fn);
        if (rc != 0) {
            return Result<void>::Err(fmt::format("{} failed: {}", op, error_for(rc)),
                                     kind_for_rc(*h_, rc));
        }
        return Result<void>::Ok();
    }

    ErrorKind kind() { return h_->closed.load() ? ErrorKind::NotConnected : ErrorKind::Transfer; }

    std::string error_for(int rc) {
        if (h_->closed.load()) return "Connection closed";
        if (rc == LIBSSH2_ERROR_TIMEOUT) return "Timed out";
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long code;
            {
                std::lock_guard<std::mutex> lock(h_->io);
                code = libssh2_sftp_last_error(sftp_);
            }
            return sftp_status_text(code);
        }
        return last_error(*h_);
    }

    void close_handle(LIBSSH2_SFTP_HANDLE* fh) {
        int rc = io_retry(*h_, deadline_in(2000), [&] { return libssh2_sftp_close_handle(fh); });
        if (rc != 0) sshlite_log(fmt::format("SFTP: close handle failed ({})", rc));
    }
};

// ── Keyboard-interactive ──────────────────────────────────

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    const AuthAttempt* attempt;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        std::string answer;
        if (prompt_text.find("assword") != std::string::npos && !data->attempt->secret.empty()) {
            answer = data->attempt->secret;
        } else if (data->attempt->responder) {
            answer = data->attempt->responder(prompt_text, prompts[i].echo != 0);
        } else {
            answer = data->attempt->secret;
        }
        responses[i].text = strdup(answer.c_str());
        responses[i].length = static_cast<unsigned int>(answer.size());
    }
}

// ── Libssh2Transport ──────────────────────────────────────

Libssh2Transport::Libssh2Transport() = default;

Libssh2Transport::~Libssh2Transport() {
    teardown(false);
    if (monitor_.joinable()) {
        if (monitor_.get_id() == std::this_thread::get_id()) {
            monitor_.detach();
        } else {
            monitor_.join();
        }
    }
}

void Libssh2Transport::set_close_handler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    close_handler_ = std::move(handler);
}

Result<void> Libssh2Transport::tcp_connect(const HostConfig& host, int timeout_ms, socket_t& out) {
    platform::init_networking();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(host.port);
    int gai = getaddrinfo(host.address.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<void>::Err(fmt::format("Cannot resolve {}: {}", host.address, gai_strerror(gai)),
                                 ErrorKind::HostNotFound);
    }

    auto deadline = deadline_in(timeout_ms);
    Result<void> last = Result<void>::Err("No usable address for " + host.address,
                                          ErrorKind::HostNotFound);

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        socket_t s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == SSHLITE_INVALID_SOCKET) continue;
        platform::set_nonblocking(s);

        int ret = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            int e = errno;
            platform::close_socket(s);
            last = Result<void>::Err(fmt::format("Connect to {}:{} failed: {}", host.address,
                                                 host.port, std::strerror(e)),
                                     e == ECONNREFUSED ? ErrorKind::ConnectionRefused
                                                       : ErrorKind::Connection);
            continue;
        }

        if (ret < 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            int revents = left > 0 ? platform::poll_socket(s, POLLOUT, static_cast<int>(left)) : 0;
            if (revents == 0) {
                platform::close_socket(s);
                last = Result<void>::Err(fmt::format("Connection to {}:{} timed out after {}ms",
                                                     host.address, host.port, timeout_ms),
                                         ErrorKind::ConnectionTimeout);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                platform::close_socket(s);
                ErrorKind k = sock_err == ECONNREFUSED ? ErrorKind::ConnectionRefused
                            : sock_err == ETIMEDOUT    ? ErrorKind::ConnectionTimeout
                                                       : ErrorKind::Connection;
                last = Result<void>::Err(fmt::format("Connect to {}:{} failed: {}", host.address,
                                                     host.port, std::strerror(sock_err)), k);
                continue;
            }
        }

        platform::enable_keepalive(s, 60);
        out = s;
        freeaddrinfo(res);
        return Result<void>::Ok();
    }

    freeaddrinfo(res);
    return last;
}

static const char* hostkey_algorithm(int type) {
    switch (type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "ssh-rsa";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "ssh-dss";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ecdsa-sha2-nistp256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ecdsa-sha2-nistp384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ssh-ed25519";
#endif
        default: return "unknown";
    }
}

Result<void> Libssh2Transport::verify_host_key(SshHandle& h, const HostConfig& host,
                                               const HostKeyCheck& check) {
    PresentedHostKey key;
    key.address = host.address;
    key.port = host.port;
    {
        std::lock_guard<std::mutex> lock(h.io);
        size_t len = 0;
        int type = 0;
        const char* raw = libssh2_session_hostkey(h.session, &len, &type);
        if (!raw || len == 0) {
            return Result<void>::Err("Server presented no host key", ErrorKind::HostVerification);
        }
        key.algorithm = hostkey_algorithm(type);

        const char* digest = libssh2_hostkey_hash(h.session, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (!digest) {
            return Result<void>::Err("Cannot hash host key", ErrorKind::HostVerification);
        }
        // OpenSSH style: base64 without trailing padding
        std::string b64 = base64_encode(std::string(digest, 32));
        while (!b64.empty() && b64.back() == '=') b64.pop_back();
        key.fingerprint = "SHA256:" + b64;
    }

    if (!check) return Result<void>::Ok();
    auto verdict = check(key);
    if (verdict.is_err() && verdict.kind != ErrorKind::HostVerification) {
        return Result<void>::Err(verdict.error, ErrorKind::HostVerification);
    }
    return verdict;
}

Result<void> Libssh2Transport::authenticate(SshHandle& h, const HostConfig& host,
                                            const AuthOffer& offer, int timeout_ms) {
    const std::string& user = host.username;
    const unsigned ulen = static_cast<unsigned>(user.size());
    int step_ms = std::max(timeout_ms, 30000);

    char* list = io_retry_ptr<char>(h, deadline_in(step_ms), [&] {
        return libssh2_userauth_list(h.session, user.c_str(), ulen);
    });
    {
        std::lock_guard<std::mutex> lock(h.io);
        if (!list && libssh2_userauth_authenticated(h.session)) return Result<void>::Ok();
    }
    std::string methods = list ? list : "";
    sshlite_log(fmt::format("Transport {}: server auth methods: {}", target_, methods));

    auto allowed = [&](const char* name) {
        return methods.empty() || methods.find(name) != std::string::npos;
    };

    std::vector<std::string> tried;
    for (const auto& attempt : offer.attempts) {
        if (h.closed.load()) break;
        int rc = -1;

        switch (attempt.method) {
            case AuthMethod::PublicKey: {
                if (!allowed("publickey")) continue;
                const char* pass = attempt.secret.empty() ? nullptr : attempt.secret.c_str();
                rc = io_retry(h, deadline_in(step_ms), [&] {
                    return libssh2_userauth_publickey_fromfile_ex(
                        h.session, user.c_str(), ulen, nullptr, attempt.key_path.c_str(), pass);
                });
                break;
            }
            case AuthMethod::Agent: {
                if (!allowed("publickey")) continue;
                LIBSSH2_AGENT* agent;
                {
                    std::lock_guard<std::mutex> lock(h.io);
                    agent = libssh2_agent_init(h.session);
                }
                if (!agent) continue;
                if (io_retry(h, deadline_in(step_ms), [&] { return libssh2_agent_connect(agent); }) == 0 &&
                    io_retry(h, deadline_in(step_ms), [&] { return libssh2_agent_list_identities(agent); }) == 0) {
                    struct libssh2_agent_publickey* identity = nullptr;
                    struct libssh2_agent_publickey* prev = nullptr;
                    while (true) {
                        int g;
                        {
                            std::lock_guard<std::mutex> lock(h.io);
                            g = libssh2_agent_get_identity(agent, &identity, prev);
                        }
                        if (g != 0) break;
                        rc = io_retry(h, deadline_in(step_ms), [&] {
                            return libssh2_agent_userauth(agent, user.c_str(), identity);
                        });
                        if (rc == 0) break;
                        prev = identity;
                    }
                }
                std::lock_guard<std::mutex> lock(h.io);
                libssh2_agent_disconnect(agent);
                libssh2_agent_free(agent);
                break;
            }
            case AuthMethod::Password: {
                if (!allowed("password")) continue;
                rc = io_retry(h, deadline_in(step_ms), [&] {
                    return libssh2_userauth_password_ex(h.session, user.c_str(), ulen,
                                                        attempt.secret.c_str(),
                                                        static_cast<unsigned>(attempt.secret.size()),
                                                        nullptr);
                });
                break;
            }
            case AuthMethod::KeyboardInteractive: {
                if (!allowed("keyboard-interactive")) continue;
                KbdAuthData kbd{&attempt};
                {
                    std::lock_guard<std::mutex> lock(h.io);
                    *libssh2_session_abstract(h.session) = &kbd;
                }
                // Responder may wait on a human: no deadline beyond the server's own
                rc = io_retry(h, Clock::time_point::max(), [&] {
                    return libssh2_userauth_keyboard_interactive_ex(h.session, user.c_str(), ulen,
                                                                    kbd_callback);
                });
                std::lock_guard<std::mutex> lock(h.io);
                *libssh2_session_abstract(h.session) = nullptr;
                break;
            }
        }

        tried.push_back(auth_method_name(attempt.method));
        if (rc == 0) {
            sshlite_log(fmt::format("Transport {}: authenticated via {}", target_,
                                    auth_method_name(attempt.method)));
            return Result<void>::Ok();
        }
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_RECV ||
            rc == LIBSSH2_ERROR_SOCKET_SEND) {
            return Result<void>::Err("Connection lost during authentication", ErrorKind::Connection);
        }
    }

    std::string joined;
    for (const auto& t : tried) joined += (joined.empty() ? "" : ", ") + t;
    return Result<void>::Err(fmt::format("Authentication failed for {} (tried: {}; server allows: {})",
                                         target_, joined.empty() ? "nothing" : joined,
                                         methods.empty() ? "?" : methods),
                             ErrorKind::Authentication);
}

Result<void> Libssh2Transport::open(const HostConfig& host, const AuthOffer& offer,
                                    const HostKeyCheck& check, const TransportOptions& options) {
    if (open_.load() || handle_) {
        return Result<void>::Err("Transport already used", ErrorKind::InvalidArgument);
    }
    ensure_libssh2_init();
    target_ = host.display();
    keepalive_interval_ms_ = options.keepalive_interval_ms;

    auto h = std::make_shared<SshHandle>();
    auto tcp = tcp_connect(host, options.connect_timeout_ms, h->sock);
    if (tcp.is_err()) return tcp;

    h->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!h->session) {
        return Result<void>::Err("Failed to create SSH session", ErrorKind::Connection);
    }
    libssh2_session_set_blocking(h->session, 0);

    int rc = io_retry(*h, deadline_in(options.connect_timeout_ms), [&] {
        return libssh2_session_handshake(h->session, h->sock);
    });
    if (rc != 0) {
        return Result<void>::Err(fmt::format("SSH handshake with {} failed: {}", target_,
                                             rc == LIBSSH2_ERROR_TIMEOUT ? "timed out" : last_error(*h)),
                                 rc == LIBSSH2_ERROR_TIMEOUT ? ErrorKind::ConnectionTimeout
                                                             : ErrorKind::Connection);
    }

    auto verified = verify_host_key(*h, host, check);
    if (verified.is_err()) {
        std::lock_guard<std::mutex> lock(h->io);
        libssh2_session_disconnect(h->session, "Host key rejected");
        return verified;
    }

    auto authed = authenticate(*h, host, offer, options.connect_timeout_ms);
    if (authed.is_err()) {
        std::lock_guard<std::mutex> lock(h->io);
        libssh2_session_disconnect(h->session, "Authentication failed");
        return authed;
    }

    if (options.keepalive_interval_ms > 0) {
        std::lock_guard<std::mutex> lock(h->io);
        libssh2_keepalive_config(h->session, 1,
                                 static_cast<unsigned>(std::max(1, options.keepalive_interval_ms / 1000)));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle_ = h;
        open_.store(true);
    }
    monitor_ = std::thread([this] { monitor_loop(); });
    sshlite_log(fmt::format("Transport {}: connected", target_));
    return Result<void>::Ok();
}

std::shared_ptr<SshHandle> Libssh2Transport::live_handle() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!handle_ || handle_->closed.load()) return nullptr;
    return handle_;
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_exec(const std::string& command) {
    using R = Result<std::unique_ptr<Channel>>;
    auto h = live_handle();
    if (!h) return R::Err("Not connected", ErrorKind::NotConnected);
    std::lock_guard<std::mutex> opening(open_mutex_);

    auto deadline = deadline_in(CHANNEL_OPEN_TIMEOUT_MS);
    LIBSSH2_CHANNEL* ch = io_retry_ptr<LIBSSH2_CHANNEL>(*h, deadline, [&] {
        return libssh2_channel_open_session(h->session);
    });
    if (!ch) return R::Err("Failed to open exec channel: " + last_error(*h), kind_for_rc(*h, -1));

    int rc = io_retry(*h, deadline, [&] {
        return libssh2_channel_process_startup(ch, "exec", 4, command.c_str(),
                                               static_cast<unsigned>(command.size()));
    });
    if (rc != 0) {
        free_channel(*h, ch);
        return R::Err("Failed to exec command on channel: " + last_error(*h), kind_for_rc(*h, rc));
    }
    return R::Ok(std::make_unique<Libssh2Channel>(h, ch));
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_shell(int cols, int rows) {
    using R = Result<std::unique_ptr<Channel>>;
    auto h = live_handle();
    if (!h) return R::Err("Not connected", ErrorKind::NotConnected);
    std::lock_guard<std::mutex> opening(open_mutex_);

    auto deadline = deadline_in(CHANNEL_OPEN_TIMEOUT_MS);
    LIBSSH2_CHANNEL* ch = io_retry_ptr<LIBSSH2_CHANNEL>(*h, deadline, [&] {
        return libssh2_channel_open_session(h->session);
    });
    if (!ch) return R::Err("Failed to open shell channel: " + last_error(*h), kind_for_rc(*h, -1));

    // Request PTY with the caller's terminal dimensions
    int rc = io_retry(*h, deadline, [&] {
        return libssh2_channel_request_pty_ex(ch, "xterm", 5, nullptr, 0, cols, rows, 0, 0);
    });
    if (rc == 0) {
        rc = io_retry(*h, deadline, [&] {
            return libssh2_channel_process_startup(ch, "shell", 5, nullptr, 0);
        });
    }
    if (rc != 0) {
        free_channel(*h, ch);
        return R::Err("Failed to request shell: " + last_error(*h), kind_for_rc(*h, rc));
    }
    return R::Ok(std::make_unique<Libssh2Channel>(h, ch));
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_direct_tcpip(const std::string& host, int port) {
    using R = Result<std::unique_ptr<Channel>>;
    auto h = live_handle();
    if (!h) return R::Err("Not connected", ErrorKind::NotConnected);
    std::lock_guard<std::mutex> opening(open_mutex_);

    LIBSSH2_CHANNEL* ch = io_retry_ptr<LIBSSH2_CHANNEL>(*h, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), [&] {
        return libssh2_channel_direct_tcpip_ex(h->session, host.c_str(), port, "127.0.0.1", 0);
    });
    if (!ch) {
        return R::Err(fmt::format("direct-tcpip to {}:{} failed: {}", host, port, last_error(*h)),
                      kind_for_rc(*h, -1));
    }
    return R::Ok(std::make_unique<Libssh2Channel>(h, ch));
}

Result<std::unique_ptr<SftpChannel>> Libssh2Transport::open_sftp() {
    using R = Result<std::unique_ptr<SftpChannel>>;
    auto h = live_handle();
    if (!h) return R::Err("Not connected", ErrorKind::NotConnected);
    std::lock_guard<std::mutex> opening(open_mutex_);

    LIBSSH2_SFTP* sftp = io_retry_ptr<LIBSSH2_SFTP>(*h, deadline_in(CHANNEL_OPEN_TIMEOUT_MS), [&] {
        return libssh2_sftp_init(h->session);
    });
    if (!sftp) return R::Err("Failed to start SFTP subsystem: " + last_error(*h), kind_for_rc(*h, -1));
    return R::Ok(std::make_unique<Libssh2Sftp>(h, sftp));
}

// ── Liveness ──────────────────────────────────────────────

bool Libssh2Transport::check_alive(SshHandle& h) {
    // Peer closed: readable with zero bytes
    int revents = platform::poll_socket(h.sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) return false;
    if (revents & POLLIN) {
        char probe;
        ssize_t n = ::recv(h.sock, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0) return false;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;
    }

    std::lock_guard<std::mutex> lock(h.io);
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(h.session, &seconds_to_next);
    return rc == 0 || rc == LIBSSH2_ERROR_EAGAIN;
}

void Libssh2Transport::monitor_loop() {
    auto next_keepalive = deadline_in(keepalive_interval_ms_);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, std::chrono::milliseconds(MONITOR_POLL_MS),
                                 [this] { return monitor_stop_; });
            if (monitor_stop_) return;
        }

        auto h = live_handle();
        if (!h) return;

        bool alive = true;
        int revents = platform::poll_socket(h->sock, POLLIN, 0);
        if (revents & (POLLERR | POLLHUP | POLLNVAL)) alive = false;
        if (alive && Clock::now() >= next_keepalive) {
            alive = check_alive(*h);
            next_keepalive = deadline_in(keepalive_interval_ms_);
        }

        if (!alive) {
            sshlite_log(fmt::format("Transport {}: connection lost", target_));
            h.reset();
            // Last action: the handler may destroy this transport
            teardown(true);
            return;
        }
    }
}

void Libssh2Transport::teardown(bool from_monitor) {
    std::shared_ptr<SshHandle> h;
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!handle_) return;
        h = std::move(handle_);
        open_.store(false);
        handler = std::move(close_handler_);
        close_handler_ = nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (!from_monitor && monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
        monitor_.join();
    }

    h->closed.store(true);
    {
        std::lock_guard<std::mutex> lock(h->io);
        libssh2_session_disconnect(h->session, "Normal disconnection");
    }
    ::shutdown(h->sock, SHUT_RDWR);
    h.reset();

    if (!from_monitor) sshlite_log(fmt::format("Transport {}: closed", target_));
    if (handler) handler();
}

void Libssh2Transport::close() {
    teardown(false);
}
