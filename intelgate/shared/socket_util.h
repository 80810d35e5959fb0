#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <unistd.h>

// RAII owner of a socket descriptor
class scoped_fd
{
public:
    scoped_fd() noexcept : m_fd(-1) {}
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}

    ~scoped_fd() { reset(); }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    scoped_fd(scoped_fd&& other) noexcept : m_fd(other.release()) {}

    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    int release() noexcept
    {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept
    {
        if (m_fd >= 0)
            ::close(m_fd);
        m_fd = fd;
    }

private:
    int m_fd;
};

// Blocking TCP connect with TCP_NODELAY. timeout_ms bounds the connect and
// becomes the socket's send/receive timeout (0 = no timeout).
scoped_fd tcp_connect(const std::string& host, uint16_t port, uint32_t timeout_ms);

// Non-blocking listening socket bound to INADDR_ANY:port
scoped_fd tcp_listen(uint16_t port, int backlog = 1024);

bool send_all(int fd, const char* data, size_t len);
