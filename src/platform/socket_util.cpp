#include "socket_util.hpp"
#include <cerrno>
#include <cstring>
#include <cstdint>

#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static const bool initialized = [] {
        WSADATA wsa;
        return WSAStartup(MAKEWORD(2, 2), &wsa) == 0;
    }();
    (void)initialized;
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags >= 0) fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = sock;
    pfd.events = events;
    return WSAPoll(&pfd, 1, timeout_ms) > 0 ? pfd.revents : 0;
#else
    struct pollfd pfd{};
    pfd.fd = sock;
    pfd.events = events;
    return poll(&pfd, 1, timeout_ms) > 0 ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

std::string last_socket_error() {
#ifdef _WIN32
    return "winsock error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

socket_t listen_loopback(int port, int backlog, std::string& error) {
    init_networking();
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == SSHLITE_INVALID_SOCKET) {
        error = last_socket_error();
        return SSHLITE_INVALID_SOCKET;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        listen(fd, backlog) != 0) {
        error = last_socket_error();
        close_socket(fd);
        return SSHLITE_INVALID_SOCKET;
    }
    return fd;
}

void enable_keepalive(socket_t sock, int idle_seconds) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&idle_seconds),
               sizeof(idle_seconds));
#else
    (void)idle_seconds;
#endif
}

} // namespace platform
