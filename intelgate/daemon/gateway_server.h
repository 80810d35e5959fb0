#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <netinet/in.h>
#include <sys/uio.h>

#include "../shared/event_loop.h"
#include "../shared/socket_util.h"
#include "../events/subscription.h"

class gateway_handler;

struct gateway_connection
{
    static constexpr size_t MAX_WRITE_BATCH = 32;
    static constexpr size_t MAX_WRITE_QUEUE = 4096;
    static constexpr size_t MAX_PARTIAL_SIZE = 1 * 1024 * 1024;
    static constexpr size_t READ_BUF_SIZE = 16384;

    int fd{-1};
    connection_ref id{0};
    bool read_pending{false};
    bool write_pending{false};
    bool closing{false};
    uint32_t write_batch_count{0};
    size_t write_batch_bytes{0};
    io_request read_req{};
    io_request write_req{};

    std::string partial;
    std::deque<std::shared_ptr<const std::string>> write_queue;

    // writev batch: holds refs alive until the CQE completes
    std::shared_ptr<const std::string> write_batch[MAX_WRITE_BATCH];
    struct iovec write_iovs[MAX_WRITE_BATCH];

    char read_buf[READ_BUF_SIZE];
};

// Newline-delimited TCP front end on the io_uring loop. Each complete line
// goes to the gateway_handler; its reply and any subscription events are
// queued on the connection and written with coalesced writev calls.
class gateway_server : public io_handler
{
public:
    gateway_server(event_loop& loop, gateway_handler& handler, uint16_t port);
    ~gateway_server() override;

    gateway_server(const gateway_server&) = delete;
    gateway_server& operator=(const gateway_server&) = delete;

    bool start();
    void stop();

    // Runs `fn` every `interval_ms` on the loop thread
    void add_periodic(uint32_t interval_ms, std::function<void()> fn);

    void on_cqe(struct io_uring_cqe* cqe) override;

    uint16_t port() const { return m_port; }
    size_t connection_count() const { return m_clients.size(); }

private:
    struct periodic_task
    {
        io_request req{};
        struct __kernel_timespec ts{};
        std::function<void()> fn;
    };

    void handle_accept(struct io_uring_cqe* cqe);
    void handle_read(struct io_uring_cqe* cqe, io_request* req);
    void handle_write(struct io_uring_cqe* cqe, io_request* req);
    void handle_timeout(io_request* req);

    void process_lines(gateway_connection* conn);
    void enqueue(gateway_connection* conn, std::string data);
    void flush_write_queue(gateway_connection* conn);
    void close_connection(gateway_connection* conn);
    void drain_ready();
    void submit_accept();

    event_loop& m_loop;
    gateway_handler& m_handler;
    uint16_t m_port;
    scoped_fd m_listen_fd;
    bool m_running{false};

    struct sockaddr_in m_accept_addr{};
    socklen_t m_accept_addrlen{sizeof(m_accept_addr)};
    io_request m_accept_req{};

    connection_ref m_next_id{1};
    std::unordered_map<int, std::unique_ptr<gateway_connection>> m_clients;
    std::unordered_map<connection_ref, gateway_connection*> m_by_id;
    std::vector<std::unique_ptr<periodic_task>> m_periodic;

    // Filled from publishers, drained by the loop's tick hook
    std::mutex m_ready_mutex;
    std::unordered_set<connection_ref> m_ready;
};
