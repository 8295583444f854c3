#pragma once

#include "crypto.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace certvet::x509
{

    // RAII deleters for OpenSSL handles
    struct X509Deleter
    {
        void operator()(X509 *p) const { X509_free(p); }
    };
    struct X509StoreDeleter
    {
        void operator()(X509_STORE *p) const { X509_STORE_free(p); }
    };
    struct X509StoreCtxDeleter
    {
        void operator()(X509_STORE_CTX *p) const { X509_STORE_CTX_free(p); }
    };
    struct X509StackDeleter
    {
        // Shallow: elements are owned by Certificate instances
        void operator()(STACK_OF(X509) * p) const { sk_X509_free(p); }
    };
    struct BIODeleter
    {
        void operator()(BIO *p) const { BIO_free_all(p); }
    };
    struct SSLCtxDeleter
    {
        void operator()(SSL_CTX *p) const { SSL_CTX_free(p); }
    };

    using X509Ptr = std::unique_ptr<X509, X509Deleter>;
    using X509StorePtr = std::unique_ptr<X509_STORE, X509StoreDeleter>;
    using X509StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, X509StoreCtxDeleter>;
    using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;
    using BIOPtr = std::unique_ptr<BIO, BIODeleter>;
    using SSLCtxPtr = std::unique_ptr<SSL_CTX, SSLCtxDeleter>;

    /** Drain the OpenSSL error queue into one line. */
    std::string last_openssl_error();

    /**
     * Parsed X.509 certificate.
     *
     * Immutable and cheap to copy: the OpenSSL handle is shared, the DER
     * encoding is cached at construction. Safe to read from several
     * threads at once.
     */
    class Certificate
    {
    public:
        /** Parse the first CERTIFICATE block of a PEM document. */
        static Result<Certificate> from_pem(std::string_view pem);

        static Result<Certificate> from_der(std::span<const uint8_t> der);

        /** Take an additional reference on an existing handle. */
        static Result<Certificate> from_handle(X509 *cert);

        X509 *native() const { return cert_.get(); }

        const crypto::Bytes &der() const { return der_; }

        std::string subject_common_name() const;
        std::vector<std::string> subject_organizations() const;
        std::string issuer_common_name() const;

        /** Subject CN, else first subject O, else empty. */
        std::string display_name() const;

        Timestamp not_before() const { return not_before_; }
        Timestamp not_after() const { return not_after_; }

        /**
         * Raw extnValue contents of the extension with the given dotted OID,
         * or nullopt if the certificate does not carry it.
         */
        std::optional<crypto::Bytes> extension_value(std::string_view oid) const;

        bool operator==(const Certificate &other) const { return der_ == other.der_; }

    private:
        Certificate(std::shared_ptr<X509> cert, crypto::Bytes der, Timestamp not_before, Timestamp not_after);

        std::shared_ptr<X509> cert_;
        crypto::Bytes der_;
        Timestamp not_before_;
        Timestamp not_after_;
    };

} // namespace certvet::x509
