#pragma once

#include "fingerprint.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include "x509.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace certvet
{

    /**
     * Date-based trust constraints for one CA in one store.
     * Every field is optional; all three absent means "no restriction".
     */
    struct Constraints
    {
        std::optional<Timestamp> not_before_max; // leaf NotBefore must be <= this
        std::optional<Timestamp> distrust_date;  // CA wholly distrusted after this
        std::optional<Timestamp> sct_not_after;  // some SCT must be <= this

        bool is_empty() const
        {
            return !not_before_max && !distrust_date && !sct_not_after;
        }

        bool operator==(const Constraints &) const = default;
    };

    /**
     * One platform/version root store snapshot.
     * Built once by the loader and shared read-only afterwards.
     */
    struct Store
    {
        Platform platform{Platform::IOS};
        std::string version;
        std::vector<Fingerprint> fingerprints; // ordered, no duplicates
        std::unordered_map<Fingerprint, Constraints> constraints; // non-empty entries only

        PlatformVersion platform_version() const { return {platform, version}; }

        /** Constraints for a root, empty if none are recorded. */
        Constraints constraint_for(const Fingerprint &fp) const;
    };

    /**
     * Abstract certificate lookup used by the validator.
     * Tests substitute their own registry; nothing here is global.
     */
    class CertificateLookup
    {
    public:
        virtual ~CertificateLookup() = default;

        /**
         * Certificate for a fingerprint, or nullptr when the fingerprint is a
         * known root whose certificate bytes are unavailable.
         */
        virtual const x509::Certificate *find(const Fingerprint &fp) const = 0;
    };

    /**
     * Fingerprint -> parsed certificate map, populated at load time.
     */
    class CertificateRegistry : public CertificateLookup
    {
    public:
        CertificateRegistry() = default;

        /** Insert under the certificate's own fingerprint. */
        Fingerprint add(x509::Certificate cert);

        /** Insert under an explicit fingerprint (as recorded upstream). */
        void add(const Fingerprint &fp, x509::Certificate cert);

        const x509::Certificate *find(const Fingerprint &fp) const override;

        size_t size() const { return certs_.size(); }
        bool empty() const { return certs_.empty(); }

        const std::unordered_map<Fingerprint, x509::Certificate> &entries() const { return certs_; }

    private:
        std::unordered_map<Fingerprint, x509::Certificate> certs_;
    };

    /** One problem found by TrustStoreSnapshot::check_quality. */
    struct QualityIssue
    {
        std::optional<PlatformVersion> store; // nullopt for registry-wide issues
        std::string message;
    };

    /**
     * Immutable bundle of all stores plus the certificate registry.
     * Constructed once by the loader and passed by const reference.
     */
    class TrustStoreSnapshot
    {
    public:
        TrustStoreSnapshot(std::vector<Store> stores, CertificateRegistry registry);

        const std::vector<Store> &stores() const { return stores_; }
        const CertificateRegistry &registry() const { return registry_; }

        /**
         * Consistency checks over the loaded data: duplicate entries,
         * out-of-range constraint dates, malformed versions, and registry
         * certificates no store refers to.
         */
        std::vector<QualityIssue> check_quality() const;

    private:
        std::vector<Store> stores_;
        CertificateRegistry registry_;
    };

} // namespace certvet
