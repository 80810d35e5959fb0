#include "gateway_server.h"
#include "gateway_handler.h"
#include "../shared/logging.h"

#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

gateway_server::gateway_server(event_loop& loop, gateway_handler& handler, uint16_t port)
    : m_loop(loop), m_handler(handler), m_port(port)
{
}

gateway_server::~gateway_server()
{
    stop();
}

bool gateway_server::start()
{
    m_listen_fd = tcp_listen(m_port);
    if (!m_listen_fd)
    {
        LOG_ERRORF("gateway: cannot listen on port %u: %s", static_cast<unsigned>(m_port), std::strerror(errno));
        return false;
    }

    m_handler.set_ready_callback([this](connection_ref conn) {
        std::lock_guard<std::mutex> lock(m_ready_mutex);
        m_ready.insert(conn);
    });
    m_loop.add_tick_hook([this]() { drain_ready(); });

    m_accept_req = { this, nullptr, m_listen_fd.get(), 0, op_accept };
    m_running = true;
    submit_accept();
    m_loop.flush();

    LOG_INFOF("gateway: listening on port %u", static_cast<unsigned>(m_port));
    return true;
}

void gateway_server::stop()
{
    if (!m_running)
        return;
    m_running = false;

    for (auto& [fd, conn] : m_clients)
    {
        m_handler.close(conn->id);
        ::close(fd);
    }
    m_clients.clear();
    m_by_id.clear();
    m_listen_fd.reset();
    m_handler.set_ready_callback(nullptr);
}

void gateway_server::add_periodic(uint32_t interval_ms, std::function<void()> fn)
{
    auto task = std::make_unique<periodic_task>();
    task->ts.tv_sec = interval_ms / 1000;
    task->ts.tv_nsec = static_cast<long long>(interval_ms % 1000) * 1000000LL;
    task->fn = std::move(fn);
    task->req = { this, nullptr, -1, 0, op_timeout };
    m_loop.submit_timeout(&task->ts, &task->req);
    m_periodic.push_back(std::move(task));
}

void gateway_server::submit_accept()
{
    if (!m_listen_fd)
        return;
    m_accept_addrlen = sizeof(m_accept_addr);
    m_loop.submit_accept(m_listen_fd.get(), &m_accept_addr, &m_accept_addrlen, &m_accept_req);
}

void gateway_server::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req)
        return;

    switch (req->type)
    {
        case op_accept:
            handle_accept(cqe);
            break;
        case op_read:
            handle_read(cqe, req);
            break;
        case op_write:
        case op_writev:
            handle_write(cqe, req);
            break;
        case op_timeout:
            handle_timeout(req);
            break;
    }
}

void gateway_server::handle_accept(struct io_uring_cqe* cqe)
{
    int client_fd = cqe->res;
    if (client_fd < 0)
    {
        if (client_fd != -ECANCELED)
            LOG_WARNF("gateway: accept failed: %s", std::strerror(-client_fd));
        if (m_running)
            submit_accept();
        return;
    }

    if (!m_running)
    {
        ::close(client_fd);
        return;
    }

    int opt = 1;
    setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    auto conn = std::make_unique<gateway_connection>();
    conn->fd = client_fd;
    conn->id = m_next_id++;
    conn->partial.reserve(4096);
    conn->read_req = { this, conn->read_buf, client_fd, sizeof(conn->read_buf), op_read };
    conn->write_req = { this, nullptr, client_fd, 0, op_write };

    auto* ptr = conn.get();
    m_clients[client_fd] = std::move(conn);
    m_by_id[ptr->id] = ptr;
    m_handler.open(ptr->id);

    LOG_DEBUGF("gateway: connection %llu accepted (fd %d)", static_cast<unsigned long long>(ptr->id), client_fd);

    ptr->read_pending = true;
    m_loop.submit_read(client_fd, ptr->read_buf, sizeof(ptr->read_buf), &ptr->read_req);
    submit_accept();
}

void gateway_server::handle_read(struct io_uring_cqe* cqe, io_request* req)
{
    auto it = m_clients.find(req->fd);
    if (it == m_clients.end())
        return;
    gateway_connection* conn = it->second.get();
    conn->read_pending = false;

    if (cqe->res <= 0)
    {
        conn->closing = true;
        if (!conn->write_pending)
            close_connection(conn);
        return;
    }

    conn->partial.append(conn->read_buf, static_cast<size_t>(cqe->res));
    process_lines(conn);
    if (conn->closing)
        return;

    if (conn->partial.size() > gateway_connection::MAX_PARTIAL_SIZE)
    {
        LOG_WARNF("gateway: connection %llu sent an oversized line",
                  static_cast<unsigned long long>(conn->id));
        conn->partial.clear();
        conn->closing = true;
        enqueue(conn, "-ERR line too long\n");
        return;
    }

    conn->read_pending = true;
    m_loop.submit_read(conn->fd, conn->read_buf, sizeof(conn->read_buf), &conn->read_req);
}

void gateway_server::process_lines(gateway_connection* conn)
{
    std::string reply;
    size_t start = 0;
    size_t pos;
    while ((pos = conn->partial.find('\n', start)) != std::string::npos)
    {
        std::string_view line(conn->partial.data() + start, pos - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        m_handler.handle_line(conn->id, line, reply);
        start = pos + 1;
    }
    if (start > 0)
        conn->partial.erase(0, start);

    if (!reply.empty())
        enqueue(conn, std::move(reply));
}

void gateway_server::enqueue(gateway_connection* conn, std::string data)
{
    if (conn->write_queue.size() >= gateway_connection::MAX_WRITE_QUEUE)
    {
        LOG_WARNF("gateway: connection %llu write queue full, closing",
                  static_cast<unsigned long long>(conn->id));
        // A full queue implies a write in flight; its completion closes
        conn->closing = true;
        if (conn->read_pending)
            m_loop.submit_cancel_fd(conn->fd);
        return;
    }

    conn->write_queue.push_back(std::make_shared<const std::string>(std::move(data)));
    if (!conn->write_pending)
        flush_write_queue(conn);
}

void gateway_server::flush_write_queue(gateway_connection* conn)
{
    if (conn->write_queue.empty())
        return;

    // Coalesce up to MAX_WRITE_BATCH messages into a single writev
    uint32_t count = 0;
    size_t bytes = 0;
    while (!conn->write_queue.empty() && count < gateway_connection::MAX_WRITE_BATCH)
    {
        conn->write_batch[count] = std::move(conn->write_queue.front());
        conn->write_queue.pop_front();

        conn->write_iovs[count].iov_base = const_cast<char*>(conn->write_batch[count]->data());
        conn->write_iovs[count].iov_len = conn->write_batch[count]->size();
        bytes += conn->write_batch[count]->size();
        count++;
    }

    conn->write_batch_count = count;
    conn->write_batch_bytes = bytes;
    conn->write_pending = true;

    if (count == 1)
    {
        conn->write_req.type = op_write;
        m_loop.submit_write(conn->fd, conn->write_batch[0]->data(),
            static_cast<uint32_t>(conn->write_batch[0]->size()), &conn->write_req);
    }
    else
    {
        conn->write_req.type = op_writev;
        m_loop.submit_writev(conn->fd, conn->write_iovs, count, &conn->write_req);
    }
}

void gateway_server::handle_write(struct io_uring_cqe* cqe, io_request* req)
{
    auto it = m_clients.find(req->fd);
    if (it == m_clients.end())
        return;
    gateway_connection* conn = it->second.get();
    conn->write_pending = false;

    if (cqe->res <= 0)
    {
        for (uint32_t i = 0; i < conn->write_batch_count; i++)
            conn->write_batch[i].reset();
        conn->write_batch_count = 0;
        conn->closing = true;
        if (conn->read_pending)
            m_loop.submit_cancel_fd(conn->fd);
        else
            close_connection(conn);
        return;
    }

    // Short write: requeue the unsent tail ahead of anything queued since
    size_t written = static_cast<size_t>(cqe->res);
    if (written < conn->write_batch_bytes)
    {
        std::vector<std::shared_ptr<const std::string>> rest;
        size_t skip = written;
        for (uint32_t i = 0; i < conn->write_batch_count; i++)
        {
            const auto& piece = conn->write_batch[i];
            if (skip >= piece->size())
            {
                skip -= piece->size();
                continue;
            }
            if (skip > 0)
            {
                rest.push_back(std::make_shared<const std::string>(piece->substr(skip)));
                skip = 0;
            }
            else
            {
                rest.push_back(piece);
            }
        }
        conn->write_queue.insert(conn->write_queue.begin(), rest.begin(), rest.end());
    }

    for (uint32_t i = 0; i < conn->write_batch_count; i++)
        conn->write_batch[i].reset();
    conn->write_batch_count = 0;
    conn->write_batch_bytes = 0;

    if (!conn->write_queue.empty())
        flush_write_queue(conn);
    else if (conn->closing && !conn->read_pending)
        close_connection(conn);
}

void gateway_server::handle_timeout(io_request* req)
{
    for (auto& task : m_periodic)
    {
        if (&task->req != req)
            continue;
        task->fn();
        if (m_running)
            m_loop.submit_timeout(&task->ts, &task->req);
        return;
    }
}

void gateway_server::close_connection(gateway_connection* conn)
{
    int fd = conn->fd;
    connection_ref id = conn->id;

    LOG_DEBUGF("gateway: connection %llu closed", static_cast<unsigned long long>(id));

    m_handler.close(id);
    m_by_id.erase(id);
    {
        std::lock_guard<std::mutex> lock(m_ready_mutex);
        m_ready.erase(id);
    }
    ::close(fd);
    m_clients.erase(fd);
}

void gateway_server::drain_ready()
{
    std::unordered_set<connection_ref> ready;
    {
        std::lock_guard<std::mutex> lock(m_ready_mutex);
        ready.swap(m_ready);
    }

    for (connection_ref id : ready)
    {
        auto it = m_by_id.find(id);
        if (it == m_by_id.end() || it->second->closing)
            continue;

        gateway_connection* conn = it->second;
        std::string events;
        size_t n = m_handler.drain_events(id, events);
        if (n > 0)
            enqueue(conn, std::move(events));

        // More queued than one drain takes: come back next tick
        if (n >= gateway_handler::MAX_EVENTS_PER_DRAIN)
        {
            std::lock_guard<std::mutex> lock(m_ready_mutex);
            m_ready.insert(id);
        }
    }
    m_loop.flush();
}
