#include "socket_util.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

static void set_io_timeout(int fd, uint32_t timeout_ms)
{
    if (timeout_ms == 0)
        return;
    struct timeval tv{};
    tv.tv_sec = static_cast<long>(timeout_ms / 1000);
    tv.tv_usec = static_cast<long>((timeout_ms % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

static bool connect_with_timeout(int fd, const struct sockaddr* addr, socklen_t len, uint32_t timeout_ms)
{
    if (timeout_ms == 0)
        return ::connect(fd, addr, len) == 0;

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool ok = false;
    if (::connect(fd, addr, len) == 0)
    {
        ok = true;
    }
    else if (errno == EINPROGRESS)
    {
        struct pollfd pfd{fd, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) == 1)
        {
            int err = 0;
            socklen_t elen = sizeof(err);
            ok = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) == 0 && err == 0;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return ok;
}

scoped_fd tcp_connect(const std::string& host, uint16_t port, uint32_t timeout_ms)
{
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    char port_str[8];
    std::snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port));

    if (getaddrinfo(host.c_str(), port_str, &hints, &res) != 0 || !res)
        return scoped_fd{};

    scoped_fd fd;
    for (auto* rp = res; rp; rp = rp->ai_next)
    {
        scoped_fd candidate(::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol));
        if (!candidate)
            continue;

        if (connect_with_timeout(candidate.get(), rp->ai_addr, rp->ai_addrlen, timeout_ms))
        {
            fd = std::move(candidate);
            break;
        }
    }

    freeaddrinfo(res);

    if (!fd)
        return fd;

    int opt = 1;
    setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    set_io_timeout(fd.get(), timeout_ms);
    return fd;
}

scoped_fd tcp_listen(uint16_t port, int backlog)
{
    scoped_fd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd)
        return fd;

    int opt = 1;
    setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (bind(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
        return scoped_fd{};

    if (listen(fd.get(), backlog) < 0)
        return scoped_fd{};

    return fd;
}

bool send_all(int fd, const char* data, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}
