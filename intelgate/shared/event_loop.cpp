#include "event_loop.h"
#include "logging.h"
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>

event_loop::event_loop(uint32_t queue_depth)
    : m_running(false), m_queue_depth(queue_depth), m_pending_submissions(0)
{
}

event_loop::~event_loop()
{
    if (m_initialized)
        io_uring_queue_exit(&m_ring);

    if (m_signal_pipe[0] >= 0) close(m_signal_pipe[0]);
    if (m_signal_pipe[1] >= 0) close(m_signal_pipe[1]);
}

void event_loop::setup_signal_pipe()
{
    if (pipe2(m_signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0)
    {
        LOG_WARN("event loop: could not create signal pipe");
        return;
    }

    m_signal_req = { nullptr, &m_signal_buf, m_signal_pipe[0], 1, op_read };

    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (sqe)
    {
        io_uring_prep_read(sqe, m_signal_pipe[0], &m_signal_buf, 1, 0);
        io_uring_sqe_set_data(sqe, &m_signal_req);
        io_uring_submit(&m_ring);
    }
}

// Get an SQE, flushing once if the submission queue is full
inline struct io_uring_sqe* event_loop::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (INTELGATE_UNLIKELY(!sqe))
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
        sqe = io_uring_get_sqe(&m_ring);
        if (!sqe)
            LOG_ERROR("event loop: submission queue exhausted");
    }
    return sqe;
}

bool event_loop::init()
{
    bool initialized = false;

    // SINGLE_ISSUER + DEFER_TASKRUN: task_work runs in io_uring_enter
    // (kernel 6.1+); fall back to a plain ring elsewhere.
    {
        struct io_uring_params params{};
        params.flags = IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN
                     | IORING_SETUP_SUBMIT_ALL | IORING_SETUP_CQSIZE;
        params.cq_entries = m_queue_depth * 4;
        if (io_uring_queue_init_params(m_queue_depth, &m_ring, &params) == 0)
            initialized = true;
    }

    if (!initialized)
    {
        int ret = io_uring_queue_init(m_queue_depth, &m_ring, 0);
        if (ret < 0)
        {
            LOG_ERRORF("event loop: io_uring_queue_init failed: %s", std::strerror(-ret));
            return false;
        }
    }

    m_initialized = true;
    setup_signal_pipe();
    return true;
}

void event_loop::flush()
{
    if (m_pending_submissions > 0)
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
    }
}

void event_loop::add_tick_hook(std::function<void()> hook)
{
    m_tick_hooks.push_back(std::move(hook));
}

void event_loop::run_tick_hooks()
{
    for (auto& hook : m_tick_hooks)
        hook();
}

void event_loop::run()
{
    m_running.store(true, std::memory_order_release);

    struct io_uring_cqe* cqe;

    while (INTELGATE_LIKELY(m_running.load(std::memory_order_relaxed)))
    {
        if (m_pending_submissions > 0)
        {
            io_uring_submit_and_wait(&m_ring, 1);
            m_pending_submissions = 0;
        }

        if (io_uring_peek_cqe(&m_ring, &cqe) != 0)
        {
            int ret = io_uring_wait_cqe(&m_ring, &cqe);
            if (ret == -EINTR)
                continue;
            if (ret < 0)
            {
                LOG_ERRORF("event loop: wait failed: %s", std::strerror(-ret));
                break;
            }
        }

        // Drain every available CQE with a single cq_advance
        unsigned head;
        unsigned count = 0;
        bool got_signal = false;

        io_uring_for_each_cqe(&m_ring, head, cqe)
        {
            count++;

            auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));

            if (INTELGATE_UNLIKELY(req == &m_signal_req))
            {
                got_signal = true;
                break;
            }

            if (INTELGATE_LIKELY(req != nullptr && req->owner != nullptr))
                req->owner->on_cqe(cqe);
        }

        io_uring_cq_advance(&m_ring, count);

        if (INTELGATE_UNLIKELY(got_signal))
        {
            m_running.store(false, std::memory_order_release);
            break;
        }

        run_tick_hooks();
    }
}

void event_loop::request_stop()
{
    m_running.store(false, std::memory_order_release);

    if (m_signal_pipe[1] >= 0)
    {
        char c = 1;
        if (write(m_signal_pipe[1], &c, 1) < 0) {}
    }
}

int event_loop::get_signal_write_fd() const
{
    return m_signal_pipe[1];
}

void event_loop::submit_accept(int listen_fd, struct sockaddr_in* addr, socklen_t* addrlen, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_accept(sqe, listen_fd, reinterpret_cast<struct sockaddr*>(addr), addrlen, SOCK_CLOEXEC);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_read(int fd, char* buf, uint32_t len, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_recv(sqe, fd, buf, len, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_write(int fd, const char* buf, uint32_t len, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    // MSG_NOSIGNAL: a peer that already hung up must not raise SIGPIPE
    io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_writev(int fd, struct iovec* iovs, uint32_t count, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_writev(sqe, fd, iovs, count, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_timeout(struct __kernel_timespec* ts, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_timeout(sqe, ts, 0, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_cancel_fd(int fd)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_cancel_fd(sqe, fd, IORING_ASYNC_CANCEL_ALL);
    // null user_data: run() ignores the cancel result CQE
    io_uring_sqe_set_data(sqe, nullptr);
    m_pending_submissions++;
}
