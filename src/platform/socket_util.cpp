#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void set_blocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

// Connect one resolved address, waiting at most timeout_ms for the
// non-blocking connect to complete.
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return Result<socket_t>::Err("Failed to create socket");
    }

    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = strerror(errno);
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + err);
    }

    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(strerror(sock_err)));
        }
    }

    set_blocking(sock);
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}", host, gai_strerror(rc)));
    }

    std::string last_error = "no usable address";
    for (const struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        auto attempt = connect_addr(ai, timeout_ms);
        if (attempt.is_ok()) {
            freeaddrinfo(res);
            return attempt;
        }
        last_error = attempt.error;
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("{}:{}: {}", host, port, last_error));
}

void enable_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
