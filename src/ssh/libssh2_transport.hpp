#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Session + socket shared by the transport and every channel opened on it.
// Freed when the last owner lets go, so a channel outliving close() fails
// cleanly instead of touching a freed session.
struct SshHandle {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHLITE_INVALID_SOCKET;
    std::mutex io;                          // held around each libssh2 call
    std::atomic<bool> closed{false};

    SshHandle() = default;
    ~SshHandle();

    SshHandle(const SshHandle&) = delete;
    SshHandle& operator=(const SshHandle&) = delete;
};

// Non-blocking libssh2 connection.  Single use: one open(), one close.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Result<void> open(const HostConfig& host, const AuthOffer& offer,
                      const HostKeyCheck& check, const TransportOptions& options) override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    void set_close_handler(CloseHandler handler) override;

    Result<std::unique_ptr<Channel>> open_exec(const std::string& command) override;
    Result<std::unique_ptr<Channel>> open_shell(int cols, int rows) override;
    Result<std::unique_ptr<Channel>> open_direct_tcpip(const std::string& host, int port) override;
    Result<std::unique_ptr<SftpChannel>> open_sftp() override;

private:
    std::mutex state_mutex_;
    std::shared_ptr<SshHandle> handle_;
    std::atomic<bool> open_{false};
    CloseHandler close_handler_;
    std::string target_;
    std::mutex open_mutex_;                 // libssh2 open state is per session

    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
    int keepalive_interval_ms_ = 30000;

    Result<void> tcp_connect(const HostConfig& host, int timeout_ms, socket_t& out);
    Result<void> verify_host_key(SshHandle& h, const HostConfig& host, const HostKeyCheck& check);
    Result<void> authenticate(SshHandle& h, const HostConfig& host, const AuthOffer& offer,
                              int timeout_ms);

    std::shared_ptr<SshHandle> live_handle();
    void monitor_loop();
    bool check_alive(SshHandle& h);
    void teardown(bool from_monitor);
};
