#include "certvet/fetcher.hpp"
#include "certvet/sct.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <memory>
#include <vector>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/ct.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace certvet
{
    namespace
    {
        struct SSLDeleter
        {
            void operator()(SSL *p) const { SSL_free(p); }
        };
        using SSLPtr = std::unique_ptr<SSL, SSLDeleter>;

        struct AddrInfoDeleter
        {
            void operator()(addrinfo *p) const { freeaddrinfo(p); }
        };

        /** Owns a connected socket. */
        class Socket
        {
        public:
            explicit Socket(int fd) : fd_(fd) {}
            ~Socket()
            {
                if (fd_ >= 0)
                    close(fd_);
            }
            Socket(const Socket &) = delete;
            Socket &operator=(const Socket &) = delete;

            int fd() const { return fd_; }

        private:
            int fd_;
        };

        Result<std::unique_ptr<Socket>> connect_tcp(const Endpoint &ep, std::chrono::seconds timeout)
        {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo *raw = nullptr;
            if (int rc = getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &raw); rc != 0)
            {
                return std::unexpected(CertvetError::network(
                    std::format("TLS connection failed: resolve {}: {}", ep.host, gai_strerror(rc))));
            }
            std::unique_ptr<addrinfo, AddrInfoDeleter> addrs(raw);

            timeval tv{};
            tv.tv_sec = static_cast<time_t>(timeout.count());

            std::string last_error = "no addresses";
            for (addrinfo *ai = addrs.get(); ai != nullptr; ai = ai->ai_next)
            {
                auto sock = std::make_unique<Socket>(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
                if (sock->fd() < 0)
                    continue;
                // Linux applies SO_SNDTIMEO to connect() as well
                setsockopt(sock->fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                setsockopt(sock->fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
                if (connect(sock->fd(), ai->ai_addr, ai->ai_addrlen) == 0)
                    return sock;
                last_error = std::strerror(errno);
            }
            return std::unexpected(CertvetError::network(
                std::format("TLS connection failed: connect {}:{}: {}", ep.host, ep.port, last_error)));
        }

        std::vector<crypto::Bytes> tls_extension_scts(SSL *ssl)
        {
            using ::SCT; // OpenSSL's sk_SCT_* macros name SCT unqualified
            std::vector<crypto::Bytes> blobs;
            const STACK_OF(SCT) *scts = SSL_get0_peer_scts(ssl);
            if (scts == nullptr)
                return blobs;

            for (int i = 0; i < sk_SCT_num(scts); ++i)
            {
                SCT *sct = sk_SCT_value(scts, i);
                if (SCT_get_source(sct) != SCT_SOURCE_TLS_EXTENSION)
                    continue;
                unsigned char *der = nullptr;
                int len = i2o_SCT(sct, &der);
                if (len <= 0)
                {
                    spdlog::debug("skipping unserializable TLS SCT: {}", x509::last_openssl_error());
                    continue;
                }
                blobs.emplace_back(der, der + len);
                OPENSSL_free(der);
            }
            return blobs;
        }
    } // namespace

    Result<Endpoint> Fetcher::parse_endpoint(std::string_view endpoint)
    {
        if (endpoint.empty())
            return std::unexpected(CertvetError::network("empty endpoint"));

        Endpoint ep;
        if (endpoint.front() == '[')
        {
            auto close_bracket = endpoint.find(']');
            if (close_bracket == std::string_view::npos)
                return std::unexpected(CertvetError::network(std::format("invalid endpoint: {}", endpoint)));
            ep.host = std::string(endpoint.substr(1, close_bracket - 1));
            auto rest = endpoint.substr(close_bracket + 1);
            if (!rest.empty())
            {
                if (rest.front() != ':' || rest.size() == 1)
                    return std::unexpected(CertvetError::network(std::format("invalid endpoint: {}", endpoint)));
                ep.port = std::string(rest.substr(1));
            }
            return ep;
        }

        auto colon = endpoint.rfind(':');
        if (colon == std::string_view::npos)
        {
            ep.host = std::string(endpoint);
            return ep;
        }
        ep.host = std::string(endpoint.substr(0, colon));
        ep.port = std::string(endpoint.substr(colon + 1));
        if (ep.host.empty() || ep.port.empty())
            return std::unexpected(CertvetError::network(std::format("invalid endpoint: {}", endpoint)));
        return ep;
    }

    Result<CertChain> Fetcher::fetch(std::string_view endpoint, std::chrono::seconds timeout)
    {
        auto ep = parse_endpoint(endpoint);
        if (!ep)
            return std::unexpected(ep.error());

        auto sock = connect_tcp(*ep, timeout);
        if (!sock)
            return std::unexpected(sock.error());
        spdlog::debug("connected to {}:{}", ep->host, ep->port);

        x509::SSLCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
        if (!ctx)
            return std::unexpected(CertvetError::network("SSL_CTX_new failed: " + x509::last_openssl_error()));
        // Trust is decided against the platform stores, not here
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

        SSLPtr ssl(SSL_new(ctx.get()));
        if (!ssl)
            return std::unexpected(CertvetError::network("SSL_new failed: " + x509::last_openssl_error()));
        SSL_set_fd(ssl.get(), (*sock)->fd());
        SSL_set_tlsext_host_name(ssl.get(), ep->host.c_str());
        if (SSL_enable_ct(ssl.get(), SSL_CT_VALIDATION_PERMISSIVE) != 1)
        {
            spdlog::debug("could not request SCT extension: {}", x509::last_openssl_error());
        }

        if (SSL_connect(ssl.get()) != 1)
        {
            return std::unexpected(CertvetError::network("TLS connection failed: " + x509::last_openssl_error()));
        }

        // Client side: the peer chain includes the leaf at index 0
        STACK_OF(X509) *peer = SSL_get_peer_cert_chain(ssl.get());
        if (peer == nullptr || sk_X509_num(peer) == 0)
        {
            return std::unexpected(CertvetError::network(std::format("no certificates received from {}", endpoint)));
        }

        auto leaf = x509::Certificate::from_handle(sk_X509_value(peer, 0));
        if (!leaf)
            return std::unexpected(leaf.error());

        CertChain chain{ep->host, std::move(*leaf), {}, {}};
        for (int i = 1; i < sk_X509_num(peer); ++i)
        {
            auto cert = x509::Certificate::from_handle(sk_X509_value(peer, i));
            if (!cert)
                return std::unexpected(cert.error());
            chain.intermediates.push_back(std::move(*cert));
        }

        chain.scts = sct::extract_tls(tls_extension_scts(ssl.get()));
        auto embedded = sct::extract_embedded(chain.leaf);
        chain.scts.insert(chain.scts.end(), embedded.begin(), embedded.end());
        spdlog::debug("{}: {} certificates, {} SCTs", ep->host, sk_X509_num(peer), chain.scts.size());

        SSL_shutdown(ssl.get());
        return chain;
    }

} // namespace certvet
