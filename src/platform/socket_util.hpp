#pragma once

// POSIX socket helpers for the SSH transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define STAGEHAND_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking / blocking mode.
void set_nonblocking(socket_t sock);
void set_blocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host (IPv4 or IPv6) and connect with a timeout.
// Returns a connected blocking socket.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probing on an established connection.
void enable_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
