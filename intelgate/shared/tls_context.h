#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

// Client-side TLS context for links to the shared cache store.
// One context is shared by every connection the store client opens.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // ca_path empty = use the system trust store.
    // client_cert/client_key non-empty = present a client certificate (mTLS).
    bool init_client(std::string_view ca_path = {},
                     std::string_view client_cert = {},
                     std::string_view client_key = {});

    bool is_initialized() const { return m_ctx != nullptr; }

    SSL_CTX* native() const { return m_ctx; }

private:
    SSL_CTX* m_ctx = nullptr;
};

// TLS session over an already connected blocking socket. Does not own the fd.
class tls_stream
{
public:
    tls_stream() = default;
    ~tls_stream();

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    // Performs the client handshake; `server_name` is used for SNI and
    // hostname verification.
    bool connect(const tls_context& ctx, int fd, const std::string& server_name);
    void close();

    bool write_all(const char* data, size_t len);
    // Bytes read, 0 on orderly shutdown, -1 on error/timeout
    int read(char* buf, int len);

    bool is_open() const { return m_ssl != nullptr; }

private:
    SSL* m_ssl = nullptr;
};
