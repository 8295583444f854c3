#pragma once

#include "chain.hpp"
#include "types.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace certvet
{

    struct Endpoint
    {
        std::string host;
        std::string port{"443"};
    };

    /**
     * TLS client that captures a server's certificate chain and SCTs.
     * No trust decision is made here; peer verification is disabled.
     */
    class Fetcher
    {
    public:
        /** "host" or "host:port"; the port defaults to 443. */
        static Result<Endpoint> parse_endpoint(std::string_view endpoint);

        /**
         * Connect, handshake and return the chain exactly as sent.
         * SCTs from the TLS extension come first, then those embedded in
         * the leaf certificate.
         */
        static Result<CertChain> fetch(std::string_view endpoint, std::chrono::seconds timeout);
    };

} // namespace certvet
