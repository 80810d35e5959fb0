#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>
#include <liburing.h>
#include <netinet/in.h>

#include "event_loop_definitions.h"

// Single-threaded io_uring completion loop. Submissions are queued and
// flushed once per loop iteration; after every drained batch of completions
// the registered tick hooks run, which is where per-request work that was
// deferred during CQE handling gets flushed.
class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 1024);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();
    void run();
    void request_stop();
    int get_signal_write_fd() const;

    void submit_accept(int listen_fd, struct sockaddr_in* addr, socklen_t* addrlen, io_request* req);
    void submit_read(int fd, char* buf, uint32_t len, io_request* req);
    void submit_write(int fd, const char* buf, uint32_t len, io_request* req);
    void submit_writev(int fd, struct iovec* iovs, uint32_t count, io_request* req);
    void submit_timeout(struct __kernel_timespec* ts, io_request* req);

    // Cancel all pending ops for a fd. Submit before close(fd) so the
    // cancellation CQEs arrive before the owning object is released.
    void submit_cancel_fd(int fd);

    // Flush all pending submissions (single syscall)
    void flush();

    // Runs after each drained completion batch, before the next wait
    void add_tick_hook(std::function<void()> hook);

    bool is_running() const { return m_running.load(std::memory_order_acquire); }

private:
    struct io_uring_sqe* get_sqe();
    void setup_signal_pipe();
    void run_tick_hooks();

    struct io_uring m_ring{};
    bool m_initialized{false};
    std::atomic<bool> m_running;
    uint32_t m_queue_depth;
    uint32_t m_pending_submissions{0};
    int m_signal_pipe[2]{-1, -1};
    io_request m_signal_req{};
    char m_signal_buf{};
    std::vector<std::function<void()>> m_tick_hooks;
};
