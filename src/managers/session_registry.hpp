#pragma once

#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/prompter.hpp>
#include <core/scheduler.hpp>
#include <core/events.hpp>
#include <ssh/session.hpp>

struct ReconnectEvent {
    std::string identity;
    HostConfig host;
    int attempt = 0;
    bool is_reconnecting = false;
    std::string error;                      // why reconnecting stopped, if it failed
    ErrorKind kind = ErrorKind::None;
};

struct ReconnectStatus {
    std::string identity;
    HostConfig host;
    int attempt = 0;
};

// Builds an unconnected session.  Tests bind this to a mock transport.
using SessionFactory = std::function<std::shared_ptr<Session>(
    const HostConfig& host, const std::optional<Credential>& credential)>;

// Identity key -> live session, plus the reconnection state machine.
//
// An unexpected transport close starts a reconnect record: attempt 0 is
// announced immediately and attempts 1, 2, ... run every
// reconnect_interval_ms through the scheduler until one succeeds, a
// non-retryable error (authentication, host verification) ends it, the
// optional attempt cap is reached, or disconnect() cancels it.
//
// disconnect() records the intent and cancels the pending timer before the
// transport is told to close, so the close notification it triggers never
// starts a reconnect.
class SessionRegistry {
public:
    SessionRegistry(SessionFactory factory, CredentialManager& credentials,
                    Prompter& prompter, Scheduler& scheduler, const SshLiteConfig& config);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns the existing connected session for the host's identity, if any.
    Result<std::shared_ptr<Session>> connect(const HostConfig& host,
                                             const std::optional<Credential>& credential = std::nullopt);

    void disconnect(const std::string& identity);
    void disconnect_all();

    // Cancel every timer, disconnect every session, refuse new connects.
    void shutdown();

    std::shared_ptr<Session> get(const std::string& identity);
    std::vector<std::shared_ptr<Session>> sessions();

    bool is_reconnecting(const std::string& identity);
    std::vector<ReconnectStatus> reconnecting();

    EventChannel<SessionStateEvent>& state_changed() { return state_changed_; }
    EventChannel<ReconnectEvent>& reconnect_events() { return reconnect_events_; }

private:
    struct Entry {
        std::shared_ptr<Session> session;
        EventChannel<SessionStateEvent>::SubscriptionId subscription = 0;
    };

    struct ReconnectRecord {
        HostConfig host;
        std::optional<Credential> credential;
        int attempt = 0;
        Scheduler::TaskId timer = 0;
    };

    SessionFactory factory_;
    CredentialManager& credentials_;
    Prompter& prompter_;
    Scheduler& scheduler_;
    const SshLiteConfig& config_;

    std::recursive_mutex mutex_;
    std::condition_variable_any idle_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, ReconnectRecord> records_;
    std::set<std::string> manual_;
    std::map<std::string, std::shared_ptr<std::mutex>> connect_locks_;
    int in_flight_ = 0;
    bool shut_down_ = false;

    EventChannel<SessionStateEvent> state_changed_;
    EventChannel<ReconnectEvent> reconnect_events_;

    std::shared_ptr<std::mutex> connect_lock(const std::string& identity);

    // Subscribes the registry to the session's state changes.
    EventChannel<SessionStateEvent>::SubscriptionId observe(const std::shared_ptr<Session>& session);
    void on_session_event(const std::weak_ptr<Session>& session, const SessionStateEvent& ev);

    void install_locked(const std::string& identity, std::shared_ptr<Session> session,
                        EventChannel<SessionStateEvent>::SubscriptionId subscription);
    void remove_locked(const std::string& identity);

    void begin_reconnect_locked(const std::string& identity, const std::shared_ptr<Session>& session);
    void schedule_locked(const std::string& identity);
    void attempt(const std::string& identity);
    std::optional<Credential> pick_credential(const HostConfig& host);
    void emit_locked(const std::string& identity, const ReconnectRecord& rec, bool reconnecting,
                     const std::string& error = "", ErrorKind kind = ErrorKind::None);
};
