#pragma once
#include <cstdint>

// Branch prediction hints for hot-path code
#ifndef INTELGATE_LIKELY
#define INTELGATE_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef INTELGATE_UNLIKELY
#define INTELGATE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

class io_handler
{
public:
    virtual ~io_handler() = default;
    virtual void on_cqe(struct io_uring_cqe* cqe) = 0;
};

enum op_type : uint8_t
{
    op_accept  = 0,
    op_read    = 1,
    op_write   = 2,
    op_writev  = 3,
    op_timeout = 4
};

struct io_request
{
    io_handler* owner;
    char* buffer;
    int fd;
    uint32_t length;
    op_type type;
};
