#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// A single active tunnel: listen socket + accept thread.
struct TunnelHandle {
    ForwardInfo info;
    std::atomic<bool> stop{false};
    std::thread thread;
    socket_t listen_fd = SSHLITE_INVALID_SOCKET;

    ~TunnelHandle();

    // Non-copyable, non-movable (thread + atomic)
    TunnelHandle() = default;
    TunnelHandle(const TunnelHandle&) = delete;
    TunnelHandle& operator=(const TunnelHandle&) = delete;
};

class PortForwarder {
public:
    // Opens one direct-tcpip channel to host:port per accepted connection.
    using ChannelOpener =
        std::function<Result<std::unique_ptr<Channel>>(const std::string& host, int port)>;

    explicit PortForwarder(ChannelOpener opener);
    ~PortForwarder();

    PortForwarder(const PortForwarder&) = delete;
    PortForwarder& operator=(const PortForwarder&) = delete;

    // Listen on 127.0.0.1:local_port and relay each connection to
    // remote_host:remote_port.  Fails before any channel is opened if the
    // port is already forwarded here or cannot be bound.
    Result<void> start(int local_port, const std::string& remote_host, int remote_port);

    // Close the listener and every relayed connection.  False if unknown.
    bool stop(int local_port);
    void stop_all();

    std::vector<ForwardInfo> active();

    // Check if a local TCP port is accepting connections.
    static bool is_port_open(int port);

private:
    ChannelOpener opener_;
    std::mutex mutex_;
    std::map<int, std::shared_ptr<TunnelHandle>> tunnels_;

    // Accept loop; one relay thread per connection, joined on stop.
    static void tunnel_thread(ChannelOpener opener, std::shared_ptr<TunnelHandle> handle);
};
