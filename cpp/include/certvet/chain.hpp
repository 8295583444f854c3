#pragma once

#include "timestamp.hpp"
#include "types.hpp"
#include "x509.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace certvet
{

    /** Where an SCT was obtained. */
    enum class SCTSource
    {
        TLSExtension,
        Embedded
    };

    /**
     * Signed Certificate Timestamp (RFC 6962)
     */
    struct SCT
    {
        Timestamp timestamp;              // when the certificate was logged
        std::array<uint8_t, 32> log_id{}; // CT log identifier
        SCTSource source{SCTSource::TLSExtension};
    };

    /**
     * Certificate chain as presented by a server. Intermediates are kept in
     * the order the peer sent them; nothing is fetched via AIA.
     */
    struct CertChain
    {
        std::string endpoint;
        x509::Certificate leaf;
        std::vector<x509::Certificate> intermediates;
        std::vector<SCT> scts; // TLS extension first, then embedded
    };

    /**
     * Outcome for one store. Produced once per store per run.
     */
    struct TrustResult
    {
        PlatformVersion platform;
        bool trusted{false};
        std::string matched_ca;                       // root that anchored the chain
        std::vector<x509::Certificate> verified_chain; // leaf..root, when path verification succeeded
        std::string failure_reason;                   // empty when trusted
    };

    /**
     * Everything the presentation layer needs for one validate run.
     */
    struct ValidationReport
    {
        std::string endpoint;
        Timestamp timestamp;
        std::string tool_version;
        std::optional<CertChain> chain;
        std::vector<TrustResult> results;
        bool all_passed{false};
    };

} // namespace certvet
