#include "session.hpp"
#include "shell_escape.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace {

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

Session::Session(HostConfig host, std::optional<Credential> credential, SessionDeps deps)
    : host_(std::move(host)),
      credential_(std::move(credential)),
      deps_(std::move(deps)),
      identity_(host_.identity_key()),
      watchers_([this](const std::string& path, FileChangeKind kind) {
          file_changed_.emit(FileChangeEvent{identity_, path, kind});
      }),
      forwarder_([this](const std::string& remote_host, int remote_port)
                     -> Result<std::unique_ptr<Channel>> {
          auto t = live_transport();
          if (!t) {
              return Result<std::unique_ptr<Channel>>::Err(
                  fmt::format("Not connected to {}", identity_), ErrorKind::NotConnected);
          }
          return t->open_direct_tcpip(remote_host, remote_port);
      }) {
}

Session::~Session() {
    std::shared_ptr<Transport> t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        t = transport_;
    }
    release_sftp();
    forwarder_.stop_all();
    watchers_.unwatch_all();
    if (t) t->close();
    join_probe();
}

ConnectionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(ConnectionState state, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }
    state_changed_.emit(SessionStateEvent{identity_, state, error});
}

std::string Session::context(const std::string& what, const std::string& path) const {
    return fmt::format("Failed to {} {} on {}", what, path, identity_);
}

std::shared_ptr<Transport> Session::live_transport() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected || !transport_) return nullptr;
    return transport_;
}

// ── Lifecycle ──────────────────────────────────────────────

Result<void> Session::connect() {
    std::lock_guard<std::mutex> connecting(connect_mutex_);

    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Connected) return Result<void>::Ok();
        gen = ++generation_;
    }
    set_state(ConnectionState::Connecting);
    join_probe();

    auto fail = [this](const std::string& msg, ErrorKind kind) {
        sshlite_log(fmt::format("Connect {} failed: {}", identity_, msg));
        set_state(ConnectionState::Error, msg);
        return Result<void>::Err(msg, kind);
    };

    auto offer = deps_.auth.build_offer(host_, credential_);
    if (offer.is_err()) return fail(offer.error, offer.kind);

    std::shared_ptr<Transport> transport(deps_.transport_factory());
    std::weak_ptr<Session> weak = weak_from_this();
    transport->set_close_handler([weak, gen] {
        if (auto self = weak.lock()) self->on_transport_closed(gen);
    });

    TransportOptions options;
    options.connect_timeout_ms = deps_.config.connect_timeout_ms;
    options.keepalive_interval_ms = deps_.config.keepalive_interval_ms;

    sshlite_log(fmt::format("Connecting {} ({} auth methods)", identity_,
                            offer.value.attempts.size()));
    auto opened = transport->open(host_, offer.value, deps_.verifier.as_check(), options);
    if (opened.is_err()) {
        transport->close();
        if (opened.kind == ErrorKind::Authentication) {
            deps_.auth.invalidate(host_);
        }
        return fail(opened.error, opened.kind);
    }

    deps_.auth.commit(host_, offer.value);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_generation_ == gen) {
            // Dropped between open() and here; the close handler already ran.
            state_ = ConnectionState::Error;
        } else {
            transport_ = transport;
            state_ = ConnectionState::Connected;
            caps_.reset();
        }
    }
    if (state() == ConnectionState::Error) {
        return fail(fmt::format("Connection to {} closed during setup", identity_),
                    ErrorKind::Connection);
    }

    sshlite_log(fmt::format("Connected {}", identity_));
    state_changed_.emit(SessionStateEvent{identity_, ConnectionState::Connected, ""});
    start_probe(gen);
    return Result<void>::Ok();
}

void Session::disconnect() {
    std::shared_ptr<Transport> t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        t = transport_;
    }
    sshlite_log(fmt::format("Disconnecting {}", identity_));

    release_sftp();
    forwarder_.stop_all();
    watchers_.unwatch_all();

    if (t && t->is_open()) {
        t->close();  // on_transport_closed finishes the transition
        return;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Disconnected) {
            state_ = ConnectionState::Disconnected;
            changed = true;
        }
    }
    if (changed) {
        state_changed_.emit(SessionStateEvent{identity_, ConnectionState::Disconnected, ""});
    }
}

void Session::on_transport_closed(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || closed_generation_ == generation) return;
        closed_generation_ = generation;
        caps_.reset();
        if (state_ == ConnectionState::Connected) state_ = ConnectionState::Disconnected;
    }
    caps_cv_.notify_all();
    sshlite_log(fmt::format("Transport for {} closed", identity_));

    release_sftp();
    forwarder_.stop_all();
    watchers_.unwatch_all();

    if (state() == ConnectionState::Disconnected) {
        state_changed_.emit(SessionStateEvent{identity_, ConnectionState::Disconnected, ""});
    }
}

void Session::release_sftp() {
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    std::shared_ptr<SftpChannel> sftp;
    {
        std::lock_guard<std::mutex> state_lock(mutex_);
        sftp = std::move(sftp_);
        sftp_.reset();
    }
    if (sftp) sftp->close();
}

// ── Capability probe ───────────────────────────────────────

void Session::start_probe(uint64_t generation) {
    probe_thread_ = std::thread([this, generation] {
        auto probe = detect_capabilities([this](const std::string& cmd) { return run(cmd); });
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ == generation && state_ == ConnectionState::Connected) {
                caps_ = probe;
            }
        }
        caps_cv_.notify_all();
    });
}

void Session::join_probe() {
    if (!probe_thread_.joinable()) return;
    if (probe_thread_.get_id() == std::this_thread::get_id()) {
        probe_thread_.detach();
    } else {
        probe_thread_.join();
    }
}

std::optional<CapabilityProbe> Session::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caps_;
}

std::optional<CapabilityProbe> Session::wait_for_capabilities(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    caps_cv_.wait_for(lock, timeout, [this] {
        return caps_.has_value() || state_ != ConnectionState::Connected;
    });
    return caps_;
}

// ── Commands ───────────────────────────────────────────────

Result<std::unique_ptr<Channel>> Session::open_exec_channel(const std::string& command) {
    auto t = live_transport();
    if (!t) {
        return Result<std::unique_ptr<Channel>>::Err(
            fmt::format("Not connected to {}", identity_), ErrorKind::NotConnected);
    }
    return t->open_exec(command);
}

Result<std::unique_ptr<Channel>> Session::open_shell(int cols, int rows) {
    auto t = live_transport();
    if (!t) {
        return Result<std::unique_ptr<Channel>>::Err(
            fmt::format("Not connected to {}", identity_), ErrorKind::NotConnected);
    }
    return t->open_shell(cols, rows);
}

Result<SSHResult> Session::run(const std::string& command, const CancelToken* cancel) {
    auto ch = open_exec_channel(command);
    if (ch.is_err()) {
        return propagate<SSHResult>(ch, fmt::format("Failed to run command on {}", identity_));
    }
    auto& channel = ch.value;

    std::string out, err;
    while (true) {
        if (is_cancelled(cancel)) {
            channel->signal("TERM");
            channel->close();
            return Result<SSHResult>::Err("Command cancelled", ErrorKind::Cancelled);
        }
        auto status = channel->poll(out, &err, 200);
        if (status == ChannelStatus::Closed) break;
        if (status == ChannelStatus::Error) {
            channel->close();
            return Result<SSHResult>::Err(
                fmt::format("Channel to {} failed while running command", identity_),
                ErrorKind::Connection);
        }
    }

    SSHResult result{channel->exit_status(), std::move(out), std::move(err)};
    channel->close();
    sshlite_log_ssh(identity_, command, result);
    return Result<SSHResult>::Ok(std::move(result));
}

Result<std::string> Session::exec(const std::string& command) {
    auto r = run(command);
    if (r.is_err()) return propagate<std::string>(r);
    if (r.value.failed()) {
        std::string detail = trimmed(r.value.stderr_data);
        if (detail.empty()) detail = trimmed(r.value.stdout_data);
        return Result<std::string>::Err(
            fmt::format("Command failed with exit code {}: {}", r.value.exit_code, detail),
            ErrorKind::Transfer);
    }
    return Result<std::string>::Ok(std::move(r.value.stdout_data));
}

// ── Files ──────────────────────────────────────────────────

// Caller holds sftp_mutex_.
Result<std::shared_ptr<SftpChannel>> Session::acquire_sftp() {
    using R = Result<std::shared_ptr<SftpChannel>>;
    std::shared_ptr<Transport> t;
    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sftp_) return R::Ok(sftp_);
        if (state_ != ConnectionState::Connected || !transport_) {
            return R::Err(fmt::format("Not connected to {}", identity_), ErrorKind::NotConnected);
        }
        t = transport_;
        gen = generation_;
    }

    auto opened = t->open_sftp();
    if (opened.is_err()) return propagate<std::shared_ptr<SftpChannel>>(opened);
    std::shared_ptr<SftpChannel> sftp(std::move(opened.value));

    std::lock_guard<std::mutex> lock(mutex_);
    if (gen != generation_ || state_ != ConnectionState::Connected) {
        sftp->close();
        return R::Err(fmt::format("Not connected to {}", identity_), ErrorKind::NotConnected);
    }
    sftp_ = sftp;
    return R::Ok(sftp);
}

RemoteFile Session::to_remote_file(const std::string& name, const std::string& path,
                                   const SftpAttrs& attrs, const std::string& longname) const {
    RemoteFile f;
    f.name = name;
    f.path = path;
    f.is_directory = attrs.is_dir;
    f.is_link = attrs.is_link;
    f.size = attrs.size;
    f.modified_ms = attrs.mtime * 1000;
    f.accessed_ms = attrs.atime * 1000;
    f.permissions = format_permissions(attrs.permissions);

    // "-rw-r--r--  1 owner group  1234 Jan  1 00:00 name"
    auto fields = split_ws(longname);
    if (fields.size() >= 4) {
        f.owner = fields[2];
        f.group = fields[3];
    }
    return f;
}

Result<std::vector<RemoteFile>> Session::list_files(const std::string& path) {
    using R = Result<std::vector<RemoteFile>>;
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<std::vector<RemoteFile>>(sftp, context("list", path));

    std::string dir = path;
    if (dir.empty() || dir == "~") {
        auto home = sftp.value->realpath(".");
        if (home.is_err()) return propagate<std::vector<RemoteFile>>(home, context("list", path));
        dir = home.value;
    }

    auto entries = sftp.value->list(dir);
    if (entries.is_err()) return propagate<std::vector<RemoteFile>>(entries, context("list", dir));

    std::vector<RemoteFile> files;
    for (const auto& e : entries.value) {
        if (e.name == "." || e.name == "..") continue;
        files.push_back(to_remote_file(e.name, join_path(dir, e.name), e.attrs, e.longname));
    }

    std::sort(files.begin(), files.end(), [](const RemoteFile& a, const RemoteFile& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        std::string la = lower(a.name), lb = lower(b.name);
        if (la != lb) return la < lb;
        return a.name < b.name;
    });
    return R::Ok(std::move(files));
}

Result<RemoteFile> Session::stat(const std::string& path) {
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<RemoteFile>(sftp, context("stat", path));

    auto attrs = sftp.value->stat(path);
    if (attrs.is_err()) return propagate<RemoteFile>(attrs, context("stat", path));
    return Result<RemoteFile>::Ok(to_remote_file(base_name(path), path, attrs.value, ""));
}

Result<std::string> Session::read_file(const std::string& path) {
    return read_file_chunked(path, nullptr, nullptr);
}

Result<std::string> Session::read_file_chunked(const std::string& path,
                                               ProgressCallback on_progress,
                                               const CancelToken* cancel, size_t chunk_size) {
    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK_SIZE;

    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<std::string>(sftp, context("read", path));

    uint64_t total = 0;
    if (on_progress) {
        auto attrs = sftp.value->stat(path);
        if (attrs.is_ok()) total = attrs.value.size;
    }

    std::string data;
    auto r = sftp.value->read(path, chunk_size, [&](const char* buf, size_t len) {
        if (is_cancelled(cancel)) return false;
        data.append(buf, len);
        if (on_progress) on_progress(data.size(), total);
        return true;
    });
    if (r.is_err()) {
        if (r.kind == ErrorKind::Cancelled) {
            sshlite_log(fmt::format("Download of {} from {} cancelled", path, identity_));
            return Result<std::string>::Err("Download cancelled", ErrorKind::Cancelled);
        }
        return propagate<std::string>(r, context("read", path));
    }
    return Result<std::string>::Ok(std::move(data));
}

Result<void> Session::write_file(const std::string& path, const std::string& content) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(deps_.config.write_timeout_ms);

    std::unique_lock<std::timed_mutex> lock(sftp_mutex_, deadline);
    if (!lock.owns_lock()) {
        return Result<void>::Err(
            fmt::format("Write of {} on {} timed out after {} ms", path, identity_,
                        deps_.config.write_timeout_ms),
            ErrorKind::Timeout);
    }
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<void>(sftp, context("write", path));

    auto r = sftp.value->write(path, content, deadline);
    if (r.is_err()) return propagate<void>(r, context("write", path));
    return Result<void>::Ok();
}

Result<void> Session::mkdir(const std::string& path) {
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<void>(sftp, context("create directory", path));
    auto r = sftp.value->mkdir(path);
    if (r.is_err()) return propagate<void>(r, context("create directory", path));
    return r;
}

Result<void> Session::rename(const std::string& from, const std::string& to) {
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<void>(sftp, context("rename", from));
    auto r = sftp.value->rename(from, to);
    if (r.is_err()) return propagate<void>(r, context("rename", from + " -> " + to));
    return r;
}

Result<void> Session::delete_file(const std::string& path) {
    std::lock_guard<std::timed_mutex> lock(sftp_mutex_);
    auto sftp = acquire_sftp();
    if (sftp.is_err()) return propagate<void>(sftp, context("delete", path));

    auto attrs = sftp.value->stat(path);
    if (attrs.is_err()) return propagate<void>(attrs, context("delete", path));

    auto r = attrs.value.is_dir ? sftp.value->rmdir(path) : sftp.value->unlink(path);
    if (r.is_err()) return propagate<void>(r, context("delete", path));
    return r;
}

Result<std::string> Session::read_file_tail(const std::string& path, uint64_t offset) {
    auto cmd = RemoteCommand("tail")
                   .literal(fmt::format("-c +{}", offset + 1))
                   .arg(path);
    auto r = run(cmd.str());
    if (r.is_err()) return propagate<std::string>(r, context("read", path));

    // tail may complain (e.g. truncated file) yet still return data
    if (r.value.failed() && r.value.stdout_data.empty()) {
        return Result<std::string>::Err(
            fmt::format("{}: {}", context("read", path), trimmed(r.value.stderr_data)),
            ErrorKind::Transfer);
    }
    return Result<std::string>::Ok(std::move(r.value.stdout_data));
}

Result<std::string> Session::read_file_first_lines(const std::string& path, int lines) {
    if (lines <= 0) {
        return Result<std::string>::Err("Line count must be positive", ErrorKind::InvalidArgument);
    }
    auto r = exec(RemoteCommand("head").literal(fmt::format("-n {}", lines)).arg(path).str());
    if (r.is_err()) return propagate<std::string>(r, context("read", path));
    return r;
}

Result<std::string> Session::read_file_last_lines(const std::string& path, int lines) {
    if (lines <= 0) {
        return Result<std::string>::Err("Line count must be positive", ErrorKind::InvalidArgument);
    }
    auto r = exec(RemoteCommand("tail").literal(fmt::format("-n {}", lines)).arg(path).str());
    if (r.is_err()) return propagate<std::string>(r, context("read", path));
    return r;
}

// ── Change notification ────────────────────────────────────

bool Session::watch_file(const std::string& path) {
    if (!is_connected()) return false;
    if (watchers_.is_watching(path)) return true;

    auto caps = wait_for_capabilities(std::chrono::milliseconds(deps_.config.watch_probe_wait_ms));
    if (!caps) {
        sshlite_log(fmt::format("Watch {}: capability probe not finished", path));
        return false;
    }

    auto cmd = watch_command(caps->method, path);
    if (!cmd) return false;

    auto ch = open_exec_channel(*cmd);
    if (ch.is_err()) {
        sshlite_log(fmt::format("Watch {} on {} failed: {}", path, identity_, ch.error));
        return false;
    }
    watchers_.watch(path, caps->method, std::move(ch.value));
    return true;
}

bool Session::unwatch_file(const std::string& path) {
    return watchers_.unwatch(path);
}

void Session::unwatch_all() {
    watchers_.unwatch_all();
}

bool Session::is_watching(const std::string& path) {
    return watchers_.is_watching(path);
}

// ── Port forwarding ────────────────────────────────────────

Result<void> Session::forward_port(int local_port, const std::string& remote_host,
                                   int remote_port) {
    if (!is_connected()) {
        return Result<void>::Err(fmt::format("Not connected to {}", identity_),
                                 ErrorKind::NotConnected);
    }
    return forwarder_.start(local_port, remote_host, remote_port);
}

bool Session::stop_forward(int local_port) {
    return forwarder_.stop(local_port);
}

std::vector<ForwardInfo> Session::active_forwards() {
    return forwarder_.active();
}
