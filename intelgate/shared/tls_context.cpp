#include "tls_context.h"
#include "logging.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

static void log_ssl_error(const char* what)
{
    unsigned long err = ERR_get_error();
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    LOG_ERRORF("[tls] %s: %s", what, err ? buf : "unknown error");
}

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

bool tls_context::init_client(std::string_view ca_path,
                              std::string_view client_cert,
                              std::string_view client_key)
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
    {
        log_ssl_error("failed to create SSL context");
        return false;
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);
    SSL_CTX_set_mode(m_ctx, SSL_MODE_AUTO_RETRY);

    bool ok;
    if (ca_path.empty())
        ok = SSL_CTX_set_default_verify_paths(m_ctx) == 1;
    else
        ok = SSL_CTX_load_verify_locations(m_ctx, std::string(ca_path).c_str(), nullptr) == 1;

    if (!ok)
    {
        log_ssl_error("failed to load trust anchors");
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
        return false;
    }
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, nullptr);

    if (!client_cert.empty() && !client_key.empty())
    {
        if (SSL_CTX_use_certificate_file(m_ctx, std::string(client_cert).c_str(), SSL_FILETYPE_PEM) <= 0 ||
            SSL_CTX_use_PrivateKey_file(m_ctx, std::string(client_key).c_str(), SSL_FILETYPE_PEM) <= 0 ||
            !SSL_CTX_check_private_key(m_ctx))
        {
            log_ssl_error("failed to load client certificate");
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }

    return true;
}

tls_stream::~tls_stream()
{
    close();
}

bool tls_stream::connect(const tls_context& ctx, int fd, const std::string& server_name)
{
    close();
    if (!ctx.is_initialized())
        return false;

    m_ssl = SSL_new(ctx.native());
    if (!m_ssl)
    {
        log_ssl_error("SSL_new failed");
        return false;
    }

    SSL_set_fd(m_ssl, fd);
    SSL_set_tlsext_host_name(m_ssl, server_name.c_str());
    SSL_set1_host(m_ssl, server_name.c_str());

    if (SSL_connect(m_ssl) != 1)
    {
        log_ssl_error("handshake failed");
        SSL_free(m_ssl);
        m_ssl = nullptr;
        return false;
    }
    return true;
}

void tls_stream::close()
{
    if (!m_ssl)
        return;
    SSL_shutdown(m_ssl);
    SSL_free(m_ssl);
    m_ssl = nullptr;
}

bool tls_stream::write_all(const char* data, size_t len)
{
    if (!m_ssl)
        return false;

    size_t sent = 0;
    while (sent < len)
    {
        int n = SSL_write(m_ssl, data + sent, static_cast<int>(len - sent));
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

int tls_stream::read(char* buf, int len)
{
    if (!m_ssl)
        return -1;

    int n = SSL_read(m_ssl, buf, len);
    if (n > 0)
        return n;

    int err = SSL_get_error(m_ssl, n);
    if (err == SSL_ERROR_ZERO_RETURN)
        return 0;
    return -1;
}
