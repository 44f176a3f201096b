#include "MacVendorsClient.hpp"
#include "../common/Errors.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanwatch::engine
{
    namespace
    {
        bool WaitForFd(int fd, short events, int timeoutMs)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;

            int r = poll(&pfd, 1, timeoutMs);
            return r > 0;
        }

        std::string OpenSslError()
        {
            unsigned long code = ERR_get_error();
            if (code == 0)
                return "unknown TLS error";
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            return buf;
        }

        std::string Trim(const std::string &s)
        {
            size_t first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";
            size_t last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        size_t lineEnd = raw.find("\r\n");
        std::string statusLine = raw.substr(0, lineEnd);
        if (statusLine.compare(0, 5, "HTTP/") != 0)
            return std::nullopt;

        size_t space = statusLine.find(' ');
        if (space == std::string::npos || space + 4 > statusLine.size())
            return std::nullopt;

        HttpResponse response;
        try
        {
            response.status = std::stoi(statusLine.substr(space + 1, 3));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }

        size_t bodyStart = raw.find("\r\n\r\n");
        if (bodyStart != std::string::npos)
            response.body = raw.substr(bodyStart + 4);
        return response;
    }

    MacVendorsClient::MacVendorsClient(std::string host, std::chrono::milliseconds timeout, int port)
        : m_host(std::move(host)), m_timeout(timeout), m_port(port), m_ssl_ctx(nullptr)
    {
        InitSSL();
    }

    MacVendorsClient::~MacVendorsClient()
    {
        CleanupSSL();
    }

    void MacVendorsClient::InitSSL()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            std::cerr << "[Vendor] SSL_CTX_new failed: " << OpenSslError() << "\n";
            return;
        }

        SSL_CTX_set_min_proto_version(m_ssl_ctx, TLS1_2_VERSION);
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(m_ssl_ctx) != 1)
            std::cerr << "[Vendor] No system CA store: " << OpenSslError() << "\n";
    }

    void MacVendorsClient::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    int MacVendorsClient::Connect()
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *result = nullptr;
        std::string port = std::to_string(m_port);
        int rc = getaddrinfo(m_host.c_str(), port.c_str(), &hints, &result);
        if (rc != 0)
            throw common::ResolutionError("cannot resolve " + m_host + ": " + gai_strerror(rc));

        int fd = -1;
        for (addrinfo *ai = result; ai; ai = ai->ai_next)
        {
            fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0)
                continue;

            fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
                break;

            if (errno == EINPROGRESS && WaitForFd(fd, POLLOUT, static_cast<int>(m_timeout.count())))
            {
                int err = 0;
                socklen_t len = sizeof(err);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
                    break;
            }

            close(fd);
            fd = -1;
        }
        freeaddrinfo(result);

        if (fd < 0)
            throw common::ResolutionError("cannot connect to " + m_host);
        return fd;
    }

    std::string MacVendorsClient::Exchange(SSL *ssl, int fd, const std::string &request)
    {
        const int timeoutMs = static_cast<int>(m_timeout.count());

        while (true)
        {
            int r = SSL_connect(ssl);
            if (r == 1)
                break;
            int err = SSL_get_error(ssl, r);
            if (err == SSL_ERROR_WANT_READ && WaitForFd(fd, POLLIN, timeoutMs))
                continue;
            if (err == SSL_ERROR_WANT_WRITE && WaitForFd(fd, POLLOUT, timeoutMs))
                continue;
            throw common::ResolutionError("TLS handshake with " + m_host + " failed: " + OpenSslError());
        }

        size_t off = 0;
        while (off < request.size())
        {
            int n = SSL_write(ssl, request.data() + off, static_cast<int>(request.size() - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ && WaitForFd(fd, POLLIN, timeoutMs))
                continue;
            if (err == SSL_ERROR_WANT_WRITE && WaitForFd(fd, POLLOUT, timeoutMs))
                continue;
            throw common::ResolutionError("write to " + m_host + " failed");
        }

        std::string raw;
        char tmp[4096];
        while (true)
        {
            int n = SSL_read(ssl, tmp, sizeof(tmp));
            if (n > 0)
            {
                raw.append(tmp, static_cast<size_t>(n));
                continue;
            }
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN)
                break;
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!WaitForFd(fd, POLLIN, timeoutMs))
                    throw common::ResolutionError("timed out reading from " + m_host);
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE && WaitForFd(fd, POLLOUT, timeoutMs))
                continue;
            // Servers commonly drop the connection without close_notify after an HTTP/1.0 reply.
            if (!raw.empty())
                break;
            throw common::ResolutionError("read from " + m_host + " failed");
        }
        return raw;
    }

    std::optional<std::string> MacVendorsClient::Lookup(const std::string &oui)
    {
        if (!m_ssl_ctx)
            throw common::ResolutionError("TLS unavailable");

        int fd = Connect();
        SSL *ssl = SSL_new(m_ssl_ctx);
        if (!ssl)
        {
            close(fd);
            throw common::ResolutionError("SSL_new failed: " + OpenSslError());
        }

        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, m_host.c_str());
        SSL_set1_host(ssl, m_host.c_str());

        std::string request = "GET /" + oui + " HTTP/1.0\r\n"
                              "Host: " + m_host + "\r\n"
                              "User-Agent: lanwatch\r\n"
                              "Accept: text/plain\r\n"
                              "Connection: close\r\n\r\n";

        std::string raw;
        try
        {
            raw = Exchange(ssl, fd, request);
        }
        catch (const common::ResolutionError &)
        {
            SSL_free(ssl);
            close(fd);
            throw;
        }

        SSL_shutdown(ssl);
        SSL_free(ssl);
        close(fd);

        auto response = ParseHttpResponse(raw);
        if (!response)
            throw common::ResolutionError("malformed response from " + m_host);

        if (response->status == 404)
            return std::nullopt;
        if (response->status != 200)
            throw common::ResolutionError(m_host + " answered " + std::to_string(response->status));

        std::string vendor = Trim(response->body);
        if (vendor.empty())
            return std::nullopt;
        return vendor;
    }
}
