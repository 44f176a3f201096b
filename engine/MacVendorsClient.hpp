#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include <openssl/ssl.h>

#include "VendorResolver.hpp"

namespace lanwatch::engine
{
    struct HttpResponse
    {
        int status = 0;
        std::string body;
    };

    // Splits a raw HTTP/1.x response. Returns nullopt when the status line is malformed.
    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // One HTTPS GET per lookup against a macvendors-style endpoint ("GET /<oui>").
    class MacVendorsClient : public VendorLookup
    {
    public:
        MacVendorsClient(std::string host, std::chrono::milliseconds timeout, int port = 443);
        ~MacVendorsClient();

        MacVendorsClient(const MacVendorsClient &) = delete;
        MacVendorsClient &operator=(const MacVendorsClient &) = delete;

        std::optional<std::string> Lookup(const std::string &oui) override;

    private:
        void InitSSL();
        void CleanupSSL();
        int Connect();
        std::string Exchange(SSL *ssl, int fd, const std::string &request);

        std::string m_host;
        std::chrono::milliseconds m_timeout;
        int m_port;
        SSL_CTX *m_ssl_ctx;
    };
}
