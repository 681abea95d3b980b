#include "session_registry.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SessionRegistry::SessionRegistry(SessionFactory factory, CredentialManager& credentials,
                                 Prompter& prompter, Scheduler& scheduler,
                                 const SshLiteConfig& config)
    : factory_(std::move(factory)),
      credentials_(credentials),
      prompter_(prompter),
      scheduler_(scheduler),
      config_(config) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

std::shared_ptr<std::mutex> SessionRegistry::connect_lock(const std::string& identity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto& m = connect_locks_[identity];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

// ── Session bookkeeping ────────────────────────────────────

EventChannel<SessionStateEvent>::SubscriptionId SessionRegistry::observe(
    const std::shared_ptr<Session>& session) {
    std::weak_ptr<Session> weak = session;
    return session->state_changed().subscribe([this, weak](const SessionStateEvent& ev) {
        on_session_event(weak, ev);
    });
}

void SessionRegistry::install_locked(const std::string& identity,
                                     std::shared_ptr<Session> session,
                                     EventChannel<SessionStateEvent>::SubscriptionId subscription) {
    remove_locked(identity);
    entries_[identity] = Entry{std::move(session), subscription};
}

void SessionRegistry::remove_locked(const std::string& identity) {
    auto it = entries_.find(identity);
    if (it == entries_.end()) return;
    it->second.session->state_changed().unsubscribe(it->second.subscription);
    entries_.erase(it);
}

void SessionRegistry::on_session_event(const std::weak_ptr<Session>& weak,
                                       const SessionStateEvent& ev) {
    state_changed_.emit(ev);
    if (ev.state != ConnectionState::Disconnected) return;

    auto session = weak.lock();
    if (!session) return;

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(ev.identity);
    if (it == entries_.end() || it->second.session != session) return;  // stale

    if (manual_.count(ev.identity) || shut_down_) {
        sshlite_log(fmt::format("Registry: {} disconnected on request", ev.identity));
        records_.erase(ev.identity);
        remove_locked(ev.identity);
        return;
    }

    begin_reconnect_locked(ev.identity, session);
}

// ── Reconnection ───────────────────────────────────────────

void SessionRegistry::emit_locked(const std::string& identity, const ReconnectRecord& rec,
                                  bool reconnecting, const std::string& error, ErrorKind kind) {
    reconnect_events_.emit(ReconnectEvent{identity, rec.host, rec.attempt, reconnecting, error, kind});
}

void SessionRegistry::begin_reconnect_locked(const std::string& identity,
                                             const std::shared_ptr<Session>& session) {
    if (records_.count(identity)) return;

    sshlite_log(fmt::format("Registry: {} dropped, reconnecting", identity));
    ReconnectRecord rec;
    rec.host = session->host();
    rec.credential = session->credential();
    auto& stored = records_[identity] = rec;
    emit_locked(identity, stored, true);
    schedule_locked(identity);
}

void SessionRegistry::schedule_locked(const std::string& identity) {
    auto it = records_.find(identity);
    if (it == records_.end()) return;
    it->second.timer = scheduler_.schedule(
        std::chrono::milliseconds(config_.reconnect_interval_ms),
        [this, identity] { attempt(identity); });
}

std::optional<Credential> SessionRegistry::pick_credential(const HostConfig& host) {
    auto stored = credentials_.list(host.identity_key());
    if (stored.empty()) return std::nullopt;
    if (stored.size() == 1) return stored.front();

    auto choice = prompter_.choose_credential(host, stored);
    if (choice && *choice < stored.size()) return stored[*choice];
    return std::nullopt;
}

void SessionRegistry::attempt(const std::string& identity) {
    HostConfig host;
    std::optional<Credential> credential;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = records_.find(identity);
        if (it == records_.end() || shut_down_) return;  // cancelled
        ++in_flight_;

        auto& rec = it->second;
        rec.timer = 0;
        ++rec.attempt;
        host = rec.host;
        credential = rec.credential;
        emit_locked(identity, rec, true);
        remove_locked(identity);
    }

    if (!credential) {
        credential = pick_credential(host);
    }

    auto conn_lock = connect_lock(identity);
    std::unique_lock<std::mutex> connecting(*conn_lock);

    auto session = factory_(host, credential);
    auto subscription = observe(session);
    auto result = session->connect();

    std::shared_ptr<Session> orphan;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = records_.find(identity);

        if (it == records_.end() || shut_down_) {
            // disconnect() won the race; this session must not survive
            session->state_changed().unsubscribe(subscription);
            if (result.is_ok()) orphan = session;
        } else if (result.is_ok()) {
            ReconnectRecord rec = it->second;
            records_.erase(it);
            install_locked(identity, session, subscription);
            sshlite_log(fmt::format("Registry: {} reconnected after {} attempt(s)",
                                    identity, rec.attempt));
            emit_locked(identity, rec, false);
            if (!session->is_connected()) begin_reconnect_locked(identity, session);
        } else {
            session->state_changed().unsubscribe(subscription);
            auto& rec = it->second;
            if (credential) rec.credential = credential;

            bool terminal = result.kind == ErrorKind::Authentication ||
                            result.kind == ErrorKind::HostVerification ||
                            (config_.reconnect_max_attempts > 0 &&
                             rec.attempt >= config_.reconnect_max_attempts);
            sshlite_log(fmt::format("Registry: reconnect {} attempt {} failed: {}{}",
                                    identity, rec.attempt, result.error,
                                    terminal ? " (giving up)" : ""));
            if (terminal) {
                ReconnectRecord last = rec;
                records_.erase(it);
                emit_locked(identity, last, false, result.error, result.kind);
            } else {
                schedule_locked(identity);
            }
        }
        --in_flight_;
    }
    idle_.notify_all();

    connecting.unlock();
    if (orphan) orphan->disconnect();
}

// ── Public surface ─────────────────────────────────────────

Result<std::shared_ptr<Session>> SessionRegistry::connect(const HostConfig& host,
                                                          const std::optional<Credential>& credential) {
    using R = Result<std::shared_ptr<Session>>;
    std::string identity = host.identity_key();

    auto conn_lock = connect_lock(identity);
    std::lock_guard<std::mutex> connecting(*conn_lock);

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (shut_down_) return R::Err("Session registry is shut down");

        auto it = entries_.find(identity);
        if (it != entries_.end() && it->second.session->is_connected()) {
            return R::Ok(it->second.session);
        }

        auto rec = records_.find(identity);
        if (rec != records_.end() && rec->second.timer != 0) {
            scheduler_.cancel(rec->second.timer);
            rec->second.timer = 0;
        }
        remove_locked(identity);
        manual_.erase(identity);
    }

    auto session = factory_(host, credential);
    auto subscription = observe(session);
    auto result = session->connect();

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rec = records_.find(identity);
    if (result.is_err()) {
        session->state_changed().unsubscribe(subscription);
        if (rec != records_.end()) schedule_locked(identity);
        return propagate<std::shared_ptr<Session>>(result);
    }

    install_locked(identity, session, subscription);
    if (rec != records_.end()) {
        ReconnectRecord done = rec->second;
        records_.erase(rec);
        emit_locked(identity, done, false);
    }
    if (!session->is_connected()) begin_reconnect_locked(identity, session);
    return R::Ok(session);
}

void SessionRegistry::disconnect(const std::string& identity) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        manual_.insert(identity);
        auto rec = records_.find(identity);
        if (rec != records_.end()) {
            if (rec->second.timer != 0) scheduler_.cancel(rec->second.timer);
            records_.erase(rec);
        }
        auto it = entries_.find(identity);
        if (it != entries_.end()) session = it->second.session;
    }

    if (session) session->disconnect();

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(identity);
    if (it != entries_.end() && it->second.session == session) remove_locked(identity);
    manual_.erase(identity);
}

void SessionRegistry::disconnect_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        for (const auto& [id, e] : entries_) ids.push_back(id);
        for (const auto& [id, r] : records_) {
            if (!entries_.count(id)) ids.push_back(id);
        }
    }
    for (const auto& id : ids) disconnect(id);
}

void SessionRegistry::shutdown() {
    {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        for (auto& [id, rec] : records_) {
            if (rec.timer != 0) scheduler_.cancel(rec.timer);
        }
        records_.clear();
        idle_.wait(lock, [this] { return in_flight_ == 0; });
    }
    disconnect_all();
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& identity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = entries_.find(identity);
    return it == entries_.end() ? nullptr : it->second.session;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::sessions() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    for (const auto& [id, e] : entries_) out.push_back(e.session);
    return out;
}

bool SessionRegistry::is_reconnecting(const std::string& identity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return records_.count(identity) > 0;
}

std::vector<ReconnectStatus> SessionRegistry::reconnecting() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<ReconnectStatus> out;
    for (const auto& [id, rec] : records_) {
        out.push_back(ReconnectStatus{id, rec.host, rec.attempt});
    }
    return out;
}
