#pragma once

// In-memory PKI for tests: P-256 keys, certificates signed on the fly.

#include "certvet/timestamp.hpp"
#include "certvet/x509.hpp"
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace certvet::testing
{
    struct PKeyDeleter
    {
        void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
    };

    struct CertSpec
    {
        std::string common_name;
        std::string organization;
        bool is_ca{false};
        Timestamp not_before{parse_rfc3339("2024-01-01T00:00:00Z").value()};
        Timestamp not_after{parse_rfc3339("2034-01-01T00:00:00Z").value()};
        std::string dns_name{"example.test"};
        std::vector<uint64_t> embedded_sct_millis; // one SCT per entry
    };

    struct Issued
    {
        x509::Certificate cert;
        std::shared_ptr<EVP_PKEY> key;
    };

    /** TLS-encoded SCT v1 with the given millisecond timestamp. */
    inline crypto::Bytes make_sct(uint64_t millis, uint8_t log_id_fill = 0xAB)
    {
        crypto::Bytes sct;
        sct.push_back(0); // v1
        sct.insert(sct.end(), 32, log_id_fill);
        for (int shift = 56; shift >= 0; shift -= 8)
            sct.push_back(static_cast<uint8_t>(millis >> shift));
        sct.push_back(0); // extensions length
        sct.push_back(0);
        sct.push_back(4); // hash: sha256
        sct.push_back(3); // signature: ecdsa
        sct.push_back(0); // signature length
        sct.push_back(2);
        sct.push_back(0x30);
        sct.push_back(0x00);
        return sct;
    }

    /** SignedCertificateTimestampList wrapping the given serialized SCTs. */
    inline crypto::Bytes make_sct_list(const std::vector<crypto::Bytes> &scts)
    {
        crypto::Bytes body;
        for (const auto &s : scts)
        {
            body.push_back(static_cast<uint8_t>(s.size() >> 8));
            body.push_back(static_cast<uint8_t>(s.size()));
            body.insert(body.end(), s.begin(), s.end());
        }
        crypto::Bytes list;
        list.push_back(static_cast<uint8_t>(body.size() >> 8));
        list.push_back(static_cast<uint8_t>(body.size()));
        list.insert(list.end(), body.begin(), body.end());
        return list;
    }

    namespace detail
    {
        inline void check(int rc, const char *what)
        {
            if (rc <= 0)
                throw std::runtime_error(std::string(what) + ": " + x509::last_openssl_error());
        }

        inline void add_ext(X509 *cert, X509 *issuer, int nid, const char *value)
        {
            X509V3_CTX ctx;
            X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
            X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
            if (ext == nullptr)
                throw std::runtime_error(std::string("extension ") + value + ": " + x509::last_openssl_error());
            int rc = X509_add_ext(cert, ext, -1);
            X509_EXTENSION_free(ext);
            check(rc, "X509_add_ext");
        }

        inline void add_embedded_scts(X509 *cert, const std::vector<uint64_t> &millis)
        {
            std::vector<crypto::Bytes> scts;
            for (auto ms : millis)
                scts.push_back(make_sct(ms));
            auto list = make_sct_list(scts);

            // extnValue is itself a DER OCTET STRING holding the list
            ASN1_OCTET_STRING *inner = ASN1_OCTET_STRING_new();
            ASN1_OCTET_STRING_set(inner, list.data(), static_cast<int>(list.size()));
            unsigned char *der = nullptr;
            int der_len = i2d_ASN1_OCTET_STRING(inner, &der);
            ASN1_OCTET_STRING_free(inner);
            check(der_len, "i2d_ASN1_OCTET_STRING");

            ASN1_OCTET_STRING *outer = ASN1_OCTET_STRING_new();
            ASN1_OCTET_STRING_set(outer, der, der_len);
            OPENSSL_free(der);

            ASN1_OBJECT *obj = OBJ_txt2obj("1.3.6.1.4.1.11129.2.4.2", 1);
            X509_EXTENSION *ext = X509_EXTENSION_create_by_OBJ(nullptr, obj, 0, outer);
            ASN1_OBJECT_free(obj);
            ASN1_OCTET_STRING_free(outer);
            if (ext == nullptr)
                throw std::runtime_error("X509_EXTENSION_create_by_OBJ: " + x509::last_openssl_error());
            int rc = X509_add_ext(cert, ext, -1);
            X509_EXTENSION_free(ext);
            check(rc, "X509_add_ext");
        }

        inline long next_serial()
        {
            static long serial = 1000;
            return ++serial;
        }
    } // namespace detail

    /**
     * Issue a certificate. With no issuer the certificate is self-signed.
     */
    inline Issued issue(const CertSpec &spec, const Issued *issuer = nullptr)
    {
        std::shared_ptr<EVP_PKEY> key(EVP_EC_gen("P-256"), PKeyDeleter{});
        if (!key)
            throw std::runtime_error("EVP_EC_gen: " + x509::last_openssl_error());

        x509::X509Ptr cert(X509_new());
        detail::check(X509_set_version(cert.get(), 2), "X509_set_version");
        detail::check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), detail::next_serial()), "serial");
        detail::check(ASN1_TIME_set(X509_getm_notBefore(cert.get()),
                                    std::chrono::system_clock::to_time_t(spec.not_before)) != nullptr,
                      "notBefore");
        detail::check(ASN1_TIME_set(X509_getm_notAfter(cert.get()),
                                    std::chrono::system_clock::to_time_t(spec.not_after)) != nullptr,
                      "notAfter");

        X509_NAME *name = X509_get_subject_name(cert.get());
        if (!spec.organization.empty())
        {
            detail::check(X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                                     reinterpret_cast<const unsigned char *>(spec.organization.c_str()),
                                                     -1, -1, 0),
                          "O");
        }
        if (!spec.common_name.empty())
        {
            detail::check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                                     reinterpret_cast<const unsigned char *>(spec.common_name.c_str()),
                                                     -1, -1, 0),
                          "CN");
        }

        X509 *issuer_cert = issuer ? issuer->cert.native() : cert.get();
        EVP_PKEY *signing_key = issuer ? issuer->key.get() : key.get();
        detail::check(X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer_cert)), "issuer");
        detail::check(X509_set_pubkey(cert.get(), key.get()), "pubkey");

        detail::add_ext(cert.get(), issuer_cert, NID_subject_key_identifier, "hash");
        if (issuer)
            detail::add_ext(cert.get(), issuer_cert, NID_authority_key_identifier, "keyid:always");
        if (spec.is_ca)
        {
            detail::add_ext(cert.get(), issuer_cert, NID_basic_constraints, "critical,CA:TRUE");
            detail::add_ext(cert.get(), issuer_cert, NID_key_usage, "critical,keyCertSign,cRLSign");
        }
        else
        {
            detail::add_ext(cert.get(), issuer_cert, NID_basic_constraints, "critical,CA:FALSE");
            detail::add_ext(cert.get(), issuer_cert, NID_key_usage, "critical,digitalSignature");
            detail::add_ext(cert.get(), issuer_cert, NID_ext_key_usage, "serverAuth");
            std::string san = "DNS:" + spec.dns_name;
            detail::add_ext(cert.get(), issuer_cert, NID_subject_alt_name, san.c_str());
        }
        if (!spec.embedded_sct_millis.empty())
            detail::add_embedded_scts(cert.get(), spec.embedded_sct_millis);

        detail::check(X509_sign(cert.get(), signing_key, EVP_sha256()), "X509_sign");

        auto wrapped = x509::Certificate::from_handle(cert.get());
        if (!wrapped)
            throw std::runtime_error(wrapped.error().what());
        return Issued{std::move(*wrapped), std::move(key)};
    }

    inline CertSpec ca_spec(std::string cn)
    {
        CertSpec spec;
        spec.common_name = std::move(cn);
        spec.is_ca = true;
        return spec;
    }

    inline CertSpec leaf_spec(std::string cn = "example.test")
    {
        CertSpec spec;
        spec.common_name = std::move(cn);
        return spec;
    }

    /** PEM text of a certificate. */
    inline std::string to_pem(const x509::Certificate &cert)
    {
        x509::BIOPtr bio(BIO_new(BIO_s_mem()));
        detail::check(PEM_write_bio_X509(bio.get(), cert.native()), "PEM_write_bio_X509");
        char *data = nullptr;
        long len = BIO_get_mem_data(bio.get(), &data);
        return std::string(data, static_cast<size_t>(len));
    }

    /** PEM with newlines escaped as a literal backslash-n, as stored in certificates.csv. */
    inline std::string to_csv_pem(const x509::Certificate &cert)
    {
        std::string out;
        for (char c : to_pem(cert))
        {
            if (c == '\n')
                out += "\\n";
            else
                out.push_back(c);
        }
        return out;
    }

    /** Fixed clock for deterministic validity and distrust checks. */
    inline Clock fixed_clock(std::string_view rfc3339)
    {
        auto ts = parse_rfc3339(rfc3339).value();
        return [ts] { return ts; };
    }

} // namespace certvet::testing
