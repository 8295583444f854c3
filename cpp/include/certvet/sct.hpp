#pragma once

#include "chain.hpp"
#include "crypto.hpp"
#include "types.hpp"
#include "x509.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace certvet::sct
{
    /** X.509 extension carrying an embedded SCT list (RFC 6962 section 3.3). */
    inline constexpr std::string_view kSCTListOID = "1.3.6.1.4.1.11129.2.4.2";

    // SCT v1 wire layout
    inline constexpr uint8_t kVersionV1 = 0;
    inline constexpr size_t kLogIDOffset = 1;
    inline constexpr size_t kLogIDSize = 32;
    inline constexpr size_t kTimestampOffset = 33;
    inline constexpr size_t kTimestampSize = 8;
    // version(1) + log_id(32) + timestamp(8) + extensions_len(2) + signature(2+)
    inline constexpr size_t kMinSize = 45;
    inline constexpr size_t kLengthPrefixSize = 2;

    /**
     * Parse one serialized SCT. Only the version, log ID and timestamp are
     * decoded; extensions and signature are left uninterpreted.
     */
    Result<SCT> parse(std::span<const uint8_t> data, SCTSource source);

    /**
     * SCTs delivered in the TLS signed_certificate_timestamp extension, one
     * blob per SCT. Malformed entries are skipped.
     */
    std::vector<SCT> extract_tls(const std::vector<crypto::Bytes> &blobs);

    /**
     * SCTs embedded in the certificate's SCT list extension. Malformed
     * entries are skipped; a truncated list yields whatever parsed before
     * the truncation.
     */
    std::vector<SCT> extract_embedded(const x509::Certificate &cert);

    /**
     * Decode a TLS-encoded SignedCertificateTimestampList
     * (2-byte total length, then [2-byte length][SCT] entries).
     */
    std::vector<SCT> parse_list(std::span<const uint8_t> list, SCTSource source);

} // namespace certvet::sct
