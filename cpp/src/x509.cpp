#include "certvet/x509.hpp"
#include <ctime>
#include <format>

#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

namespace certvet::x509
{
    namespace
    {
        std::vector<std::string> name_entries(const X509_NAME *name, int nid)
        {
            std::vector<std::string> out;
            if (name == nullptr)
                return out;

            int idx = -1;
            while ((idx = X509_NAME_get_index_by_NID(name, nid, idx)) >= 0)
            {
                const X509_NAME_ENTRY *entry = X509_NAME_get_entry(name, idx);
                const ASN1_STRING *data = X509_NAME_ENTRY_get_data(entry);
                unsigned char *utf8 = nullptr;
                int len = ASN1_STRING_to_UTF8(&utf8, data);
                if (len < 0)
                    continue;
                out.emplace_back(reinterpret_cast<const char *>(utf8), static_cast<size_t>(len));
                OPENSSL_free(utf8);
            }
            return out;
        }

        Result<Timestamp> to_timestamp(const ASN1_TIME *t)
        {
            std::tm tm_buf{};
            if (t == nullptr || ASN1_TIME_to_tm(t, &tm_buf) != 1)
            {
                return std::unexpected(CertvetError::certificate(
                    "Failed to convert ASN1_TIME: " + last_openssl_error()));
            }
            return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
        }
    } // namespace

    std::string last_openssl_error()
    {
        std::string out;
        unsigned long err = 0;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            if (!out.empty())
                out += "; ";
            out += buf;
        }
        return out.empty() ? "unknown OpenSSL error" : out;
    }

    Certificate::Certificate(std::shared_ptr<X509> cert, crypto::Bytes der, Timestamp not_before, Timestamp not_after)
        : cert_(std::move(cert)), der_(std::move(der)), not_before_(not_before), not_after_(not_after)
    {
    }

    Result<Certificate> Certificate::from_pem(std::string_view pem)
    {
        BIOPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio)
        {
            return std::unexpected(CertvetError::certificate("Could not load PEM into BIO: " + last_openssl_error()));
        }

        X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert)
        {
            return std::unexpected(CertvetError::certificate("Could not read certificate from PEM: " + last_openssl_error()));
        }
        return from_handle(cert.get());
    }

    Result<Certificate> Certificate::from_der(std::span<const uint8_t> der)
    {
        const unsigned char *p = der.data();
        X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
        if (!cert)
        {
            return std::unexpected(CertvetError::certificate("Could not parse DER certificate: " + last_openssl_error()));
        }
        return from_handle(cert.get());
    }

    Result<Certificate> Certificate::from_handle(X509 *cert)
    {
        if (cert == nullptr)
        {
            return std::unexpected(CertvetError::certificate("Null certificate handle"));
        }

        int len = i2d_X509(cert, nullptr);
        if (len <= 0)
        {
            return std::unexpected(CertvetError::certificate("Failed to serialize certificate: " + last_openssl_error()));
        }
        crypto::Bytes der(static_cast<size_t>(len));
        unsigned char *out = der.data();
        i2d_X509(cert, &out);

        auto not_before = to_timestamp(X509_get0_notBefore(cert));
        if (!not_before)
            return std::unexpected(not_before.error());
        auto not_after = to_timestamp(X509_get0_notAfter(cert));
        if (!not_after)
            return std::unexpected(not_after.error());

        if (X509_up_ref(cert) != 1)
        {
            return std::unexpected(CertvetError::certificate("X509_up_ref failed"));
        }
        std::shared_ptr<X509> shared(cert, X509Deleter{});
        return Certificate(std::move(shared), std::move(der), *not_before, *not_after);
    }

    std::string Certificate::subject_common_name() const
    {
        auto cns = name_entries(X509_get_subject_name(cert_.get()), NID_commonName);
        return cns.empty() ? std::string() : cns.front();
    }

    std::vector<std::string> Certificate::subject_organizations() const
    {
        return name_entries(X509_get_subject_name(cert_.get()), NID_organizationName);
    }

    std::string Certificate::issuer_common_name() const
    {
        auto cns = name_entries(X509_get_issuer_name(cert_.get()), NID_commonName);
        return cns.empty() ? std::string() : cns.front();
    }

    std::string Certificate::display_name() const
    {
        auto cn = subject_common_name();
        if (!cn.empty())
            return cn;
        auto orgs = subject_organizations();
        if (!orgs.empty())
            return orgs.front();
        return {};
    }

    std::optional<crypto::Bytes> Certificate::extension_value(std::string_view oid) const
    {
        std::string oid_str(oid);
        ASN1_OBJECT *obj = OBJ_txt2obj(oid_str.c_str(), 1);
        if (obj == nullptr)
        {
            ERR_clear_error();
            return std::nullopt;
        }
        int idx = X509_get_ext_by_OBJ(cert_.get(), obj, -1);
        ASN1_OBJECT_free(obj);
        if (idx < 0)
            return std::nullopt;

        X509_EXTENSION *ext = X509_get_ext(cert_.get(), idx);
        const ASN1_OCTET_STRING *data = X509_EXTENSION_get_data(ext);
        if (data == nullptr)
            return std::nullopt;

        const unsigned char *bytes = ASN1_STRING_get0_data(data);
        return crypto::Bytes(bytes, bytes + ASN1_STRING_length(data));
    }

} // namespace certvet::x509
