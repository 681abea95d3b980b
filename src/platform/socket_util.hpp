#pragma once

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHLITE_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHLITE_INVALID_SOCKET (-1)
#endif

namespace platform {

// WSAStartup once on Windows; no-op elsewhere.
void init_networking();

void set_nonblocking(socket_t sock);

// revents for one socket, 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

void close_socket(socket_t sock);

// errno / WSAGetLastError as text
std::string last_socket_error();

// Bound and listening on 127.0.0.1:port, or SSHLITE_INVALID_SOCKET with
// `error` set.  Never binds a non-loopback address.
socket_t listen_loopback(int port, int backlog, std::string& error);

// SO_KEEPALIVE plus the idle time where the OS supports setting it.
void enable_keepalive(socket_t sock, int idle_seconds);

} // namespace platform
