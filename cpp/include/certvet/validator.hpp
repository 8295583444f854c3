#pragma once

#include "chain.hpp"
#include "filter.hpp"
#include "timestamp.hpp"
#include "trust_store.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace certvet
{

    /**
     * Checks one server chain against many root stores.
     *
     * Each store is verified on its own thread; the call returns after all
     * of them finish. The chain, the stores and the certificate lookup are
     * only read, and each task writes a single pre-allocated result slot, so
     * no locking is involved. A failure in one store never affects another.
     */
    class Validator
    {
    public:
        /**
         * @param certs Fingerprint -> certificate lookup for root resolution
         * @param clock Source of "now" for distrust dates and path validity
         */
        explicit Validator(const CertificateLookup &certs, Clock clock = system_now);

        /** One result per store, in input order. */
        std::vector<TrustResult> validate_chain(const CertChain &chain, const std::vector<Store> &stores) const;

        TrustResult validate_against_store(const CertChain &chain, const Store &store) const;

        /**
         * First violated constraint, checked in the order NotBeforeMax,
         * DistrustDate, SCTNotAfter; nullopt if the chain satisfies all.
         * `now` is the instant the path was verified at.
         */
        static std::optional<std::string> check_constraints(const CertChain &chain,
                                                            const Constraints &constraints,
                                                            Timestamp now);

    private:
        const CertificateLookup &certs_;
        Clock clock_;
    };

    /**
     * Human-readable reason for an X509_V_ERR_* code. `host` is only used
     * for hostname mismatches; `detail` is the fallback text.
     */
    std::string classify_verify_error(int error, std::string_view host, std::string_view detail);

    /**
     * Full validate operation: parse the optional filter, narrow the
     * snapshot's stores, and verify the chain against what remains.
     * Empty or malformed filters and an empty selection are hard errors
     * raised before any store is examined.
     */
    Result<std::vector<TrustResult>> validate(const CertChain &chain,
                                              const TrustStoreSnapshot &snapshot,
                                              const std::optional<std::string> &filter_expr,
                                              Clock clock = system_now);

    /** Platform name ascending, then version ascending ("current" last). */
    void sort_results(std::vector<TrustResult> &results);

} // namespace certvet
