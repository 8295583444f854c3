#include "certvet/sct.hpp"
#include <algorithm>
#include <format>

#include <openssl/asn1.h>
#include <spdlog/spdlog.h>

namespace certvet::sct
{
    namespace
    {
        uint16_t read_u16(std::span<const uint8_t> data, size_t offset)
        {
            return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
        }

        uint64_t read_u64(std::span<const uint8_t> data, size_t offset)
        {
            uint64_t v = 0;
            for (size_t i = 0; i < 8; ++i)
                v = (v << 8) | data[offset + i];
            return v;
        }
    } // namespace

    Result<SCT> parse(std::span<const uint8_t> data, SCTSource source)
    {
        if (data.size() < kMinSize)
        {
            return std::unexpected(CertvetError::parse(std::format("SCT too short: {} bytes", data.size())));
        }
        if (data[0] != kVersionV1)
        {
            return std::unexpected(CertvetError::parse(std::format("unsupported SCT version: {}", data[0])));
        }

        SCT out;
        std::copy_n(data.begin() + kLogIDOffset, kLogIDSize, out.log_id.begin());
        out.timestamp = from_unix_millis(read_u64(data, kTimestampOffset));
        out.source = source;
        return out;
    }

    std::vector<SCT> extract_tls(const std::vector<crypto::Bytes> &blobs)
    {
        std::vector<SCT> out;
        for (const auto &blob : blobs)
        {
            auto parsed = parse(blob, SCTSource::TLSExtension);
            if (!parsed)
            {
                spdlog::debug("skipping TLS SCT: {}", parsed.error().what());
                continue;
            }
            out.push_back(*parsed);
        }
        return out;
    }

    std::vector<SCT> parse_list(std::span<const uint8_t> list, SCTSource source)
    {
        std::vector<SCT> out;
        if (list.size() < kLengthPrefixSize)
            return out;

        size_t list_len = read_u16(list, 0);
        if (list.size() < kLengthPrefixSize + list_len)
            return out;

        size_t end = kLengthPrefixSize + list_len;
        size_t offset = kLengthPrefixSize;
        while (offset < end)
        {
            if (offset + kLengthPrefixSize > list.size())
                break;
            size_t sct_len = read_u16(list, offset);
            offset += kLengthPrefixSize;
            if (offset + sct_len > list.size())
                break;

            auto parsed = parse(list.subspan(offset, sct_len), source);
            offset += sct_len;
            if (!parsed)
            {
                spdlog::debug("skipping SCT list entry: {}", parsed.error().what());
                continue;
            }
            out.push_back(*parsed);
        }
        return out;
    }

    std::vector<SCT> extract_embedded(const x509::Certificate &cert)
    {
        auto ext = cert.extension_value(kSCTListOID);
        if (!ext)
            return {};

        // extnValue holds an OCTET STRING wrapping the TLS-encoded list
        const unsigned char *p = ext->data();
        ASN1_OCTET_STRING *inner = d2i_ASN1_OCTET_STRING(nullptr, &p, static_cast<long>(ext->size()));
        if (inner == nullptr)
        {
            spdlog::debug("SCT list extension is not an OCTET STRING: {}", x509::last_openssl_error());
            return {};
        }

        std::span<const uint8_t> list(ASN1_STRING_get0_data(inner), static_cast<size_t>(ASN1_STRING_length(inner)));
        auto out = parse_list(list, SCTSource::Embedded);
        ASN1_OCTET_STRING_free(inner);
        return out;
    }

} // namespace certvet::sct
