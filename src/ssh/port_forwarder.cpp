#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#ifndef _WIN32
#  include <unistd.h>
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <poll.h>
#endif

// ── TunnelHandle ──────────────────────────────────────────

TunnelHandle::~TunnelHandle() {
    stop.store(true);
    if (thread.joinable()) {
        if (thread.get_id() == std::this_thread::get_id()) thread.detach();
        else thread.join();
    }
    if (listen_fd != SSHLITE_INVALID_SOCKET) {
        platform::close_socket(listen_fd);
    }
}

// ── PortForwarder ─────────────────────────────────────────

PortForwarder::PortForwarder(ChannelOpener opener)
    : opener_(std::move(opener)) {}

PortForwarder::~PortForwarder() {
    stop_all();
}

bool PortForwarder::is_port_open(int port) {
    platform::init_networking();
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SSHLITE_INVALID_SOCKET) return false;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    int rc = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    platform::close_socket(sock);
    return rc == 0;
}

// ── Relay ─────────────────────────────────────────────────

static bool send_all(socket_t fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        auto w = send(fd, data + sent, static_cast<int>(len - sent), 0);
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

// Forward data between a local TCP socket and a direct-tcpip channel.
// Runs until either side closes or stop_flag is set.
static void forward_connection(socket_t client_fd, std::unique_ptr<Channel> ch,
                               std::atomic<bool>& stop_flag) {
    char buf[FORWARD_BUF_SIZE];
    std::string inbound;

    while (!stop_flag.load()) {
        // local → channel
        int revents = platform::poll_socket(client_fd, POLLIN, 10);
        if (revents & (POLLIN | POLLHUP)) {
            auto n = recv(client_fd, buf, sizeof(buf), 0);
            if (n <= 0) break;  // client closed
            if (ch->write(std::string(buf, static_cast<size_t>(n))).is_err()) break;
        } else if (revents & (POLLERR | POLLNVAL)) {
            break;
        }

        // channel → local
        inbound.clear();
        auto status = ch->poll(inbound, nullptr, 10);
        if (!inbound.empty() && !send_all(client_fd, inbound.data(), inbound.size())) break;
        if (status != ChannelStatus::Open) break;  // remote closed
    }

    ch->close();
    platform::close_socket(client_fd);
}

void PortForwarder::tunnel_thread(ChannelOpener opener, std::shared_ptr<TunnelHandle> handle) {
    struct Conn {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Conn> conns;
    const auto& info = handle->info;

    while (!handle->stop.load()) {
        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(handle->listen_fd, POLLIN, 200);

        // Join relays that already finished
        for (auto it = conns.begin(); it != conns.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = conns.erase(it);
            } else {
                ++it;
            }
        }

        if (!(revents & POLLIN)) continue;

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        socket_t client = accept(handle->listen_fd,
                                 reinterpret_cast<struct sockaddr*>(&client_addr), &len);
        if (client == SSHLITE_INVALID_SOCKET) continue;

        auto ch = opener(info.remote_host, info.remote_port);
        if (ch.is_err()) {
            sshlite_log(fmt::format("PortForwarder: direct-tcpip to {}:{} failed: {}",
                                    info.remote_host, info.remote_port, ch.error));
            platform::close_socket(client);
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        auto* stop_flag = &handle->stop;
        conns.push_back({std::thread([client, c = std::move(ch.value), stop_flag, done]() mutable {
                             forward_connection(client, std::move(c), *stop_flag);
                             done->store(true);
                         }),
                         done});
    }

    // Clean up connection threads
    for (auto& c : conns) {
        if (c.thread.joinable()) c.thread.join();
    }
}

// ── Start/Stop ────────────────────────────────────────────

Result<void> PortForwarder::start(int local_port, const std::string& remote_host,
                                  int remote_port) {
    if (local_port <= 0 || local_port > 65535 || remote_port <= 0 || remote_port > 65535) {
        return Result<void>::Err(fmt::format("Invalid port forward {} -> {}:{}",
                                             local_port, remote_host, remote_port),
                                 ErrorKind::InvalidArgument);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (tunnels_.count(local_port)) {
        return Result<void>::Err(fmt::format("Port {} is already being forwarded", local_port),
                                 ErrorKind::InvalidArgument);
    }

    std::string reason;
    socket_t listen_fd = platform::listen_loopback(local_port, 8, reason);
    if (listen_fd == SSHLITE_INVALID_SOCKET) {
        return Result<void>::Err(fmt::format("Cannot listen on 127.0.0.1:{}: {}",
                                             local_port, reason),
                                 ErrorKind::Connection);
    }

    auto handle = std::make_shared<TunnelHandle>();
    handle->info = ForwardInfo{local_port, remote_host, remote_port};
    handle->listen_fd = listen_fd;
    handle->thread = std::thread(tunnel_thread, opener_, handle);
    tunnels_[local_port] = handle;

    sshlite_log(fmt::format("PortForwarder: localhost:{} -> {}:{} ready",
                            local_port, remote_host, remote_port));
    return Result<void>::Ok();
}

bool PortForwarder::stop(int local_port) {
    std::shared_ptr<TunnelHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(local_port);
        if (it == tunnels_.end()) return false;
        handle = it->second;
        tunnels_.erase(it);
    }
    handle->stop.store(true);
    if (handle->thread.joinable()) handle->thread.join();
    sshlite_log(fmt::format("PortForwarder: stopped localhost:{}", local_port));
    return true;
}

void PortForwarder::stop_all() {
    std::map<int, std::shared_ptr<TunnelHandle>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(tunnels_);
    }
    for (auto& [port, h] : all) {
        h->stop.store(true);
    }
    for (auto& [port, h] : all) {
        if (h->thread.joinable()) h->thread.join();
    }
}

std::vector<ForwardInfo> PortForwarder::active() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ForwardInfo> out;
    for (const auto& [port, h] : tunnels_) out.push_back(h->info);
    return out;
}
