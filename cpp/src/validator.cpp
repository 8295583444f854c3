#include "certvet/validator.hpp"
#include "certvet/version.hpp"
#include <algorithm>
#include <format>
#include <system_error>
#include <thread>
#include <unordered_set>

#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

namespace certvet
{
    namespace
    {
        const char *kNoValidRoots = "no valid root certificates in trust store";

        struct VerifyOutcome
        {
            bool ok{false};
            int error{X509_V_OK};
            std::string detail;
            std::vector<x509::Certificate> chain;
        };

        Result<VerifyOutcome> verify_path(const CertChain &chain,
                                          const std::vector<const x509::Certificate *> &roots,
                                          Timestamp now)
        {
            x509::X509StorePtr store(X509_STORE_new());
            if (!store)
            {
                return std::unexpected(CertvetError::crypto("unable to create X509_STORE: " + x509::last_openssl_error()));
            }
            for (const auto *root : roots)
            {
                if (X509_STORE_add_cert(store.get(), root->native()) != 1)
                {
                    return std::unexpected(CertvetError::crypto("unable to add trust anchor: " + x509::last_openssl_error()));
                }
            }

            x509::X509StackPtr untrusted(sk_X509_new_null());
            if (!untrusted)
            {
                return std::unexpected(CertvetError::crypto("unable to create STACK_OF(X509): " + x509::last_openssl_error()));
            }
            for (const auto &cert : chain.intermediates)
            {
                if (sk_X509_push(untrusted.get(), cert.native()) <= 0)
                {
                    return std::unexpected(CertvetError::crypto("unable to push intermediate: " + x509::last_openssl_error()));
                }
            }

            x509::X509StoreCtxPtr ctx(X509_STORE_CTX_new());
            if (!ctx)
            {
                return std::unexpected(CertvetError::crypto("unable to create X509_STORE_CTX: " + x509::last_openssl_error()));
            }
            if (X509_STORE_CTX_init(ctx.get(), store.get(), chain.leaf.native(), untrusted.get()) != 1)
            {
                return std::unexpected(CertvetError::crypto("X509_STORE_CTX_init failed: " + x509::last_openssl_error()));
            }

            // Every store entry is an anchor in its own right, self-signed or not
            X509_STORE_CTX_set_flags(ctx.get(), X509_V_FLAG_PARTIAL_CHAIN);
            X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER);
            X509_STORE_CTX_set_time(ctx.get(), 0, std::chrono::system_clock::to_time_t(now));

            VerifyOutcome outcome;
            if (X509_verify_cert(ctx.get()) != 1)
            {
                outcome.error = X509_STORE_CTX_get_error(ctx.get());
                outcome.detail = X509_verify_cert_error_string(outcome.error);
                return outcome;
            }

            STACK_OF(X509) *verified = X509_STORE_CTX_get0_chain(ctx.get());
            for (int i = 0; i < sk_X509_num(verified); ++i)
            {
                auto cert = x509::Certificate::from_handle(sk_X509_value(verified, i));
                if (!cert)
                    return std::unexpected(cert.error());
                outcome.chain.push_back(std::move(*cert));
            }
            outcome.ok = true;
            return outcome;
        }
    } // namespace

    std::string classify_verify_error(int error, std::string_view host, std::string_view detail)
    {
        switch (error)
        {
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
        case X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE:
        case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
        case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
        case X509_V_ERR_CERT_UNTRUSTED:
            return "certificate signed by unknown authority";
        case X509_V_ERR_CERT_HAS_EXPIRED:
        case X509_V_ERR_CERT_NOT_YET_VALID:
            return "certificate has expired or is not yet valid";
        case X509_V_ERR_INVALID_CA:
            return "certificate is not authorized to sign other certificates";
        case X509_V_ERR_PATH_LENGTH_EXCEEDED:
            return "too many intermediates for path length constraint";
        case X509_V_ERR_INVALID_PURPOSE:
        case X509_V_ERR_KEYUSAGE_NO_CERTSIGN:
            return "certificate specifies an incompatible key usage";
        case X509_V_ERR_SUBJECT_ISSUER_MISMATCH:
            return "issuer name does not match subject";
        case X509_V_ERR_PERMITTED_VIOLATION:
        case X509_V_ERR_EXCLUDED_VIOLATION:
            return "CA is not authorized for this name";
        case X509_V_ERR_HOSTNAME_MISMATCH:
            return std::format("certificate is not valid for {}", host);
        default:
            break;
        }
        if (!detail.empty())
            return std::string(detail);
        return std::format("certificate verification failed (error {})", error);
    }

    Validator::Validator(const CertificateLookup &certs, Clock clock)
        : certs_(certs), clock_(std::move(clock))
    {
    }

    std::vector<TrustResult> Validator::validate_chain(const CertChain &chain, const std::vector<Store> &stores) const
    {
        std::vector<TrustResult> results(stores.size());
        if (stores.empty())
            return results;

        auto run = [this, &chain, &stores, &results](size_t i) {
            const Store &store = stores[i];
            try
            {
                results[i] = validate_against_store(chain, store);
            }
            catch (const std::exception &e)
            {
                spdlog::error("{}: validation aborted: {}", to_string(store.platform_version()), e.what());
                results[i] = TrustResult{store.platform_version(), false, {}, {},
                                         std::format("internal error: {}", e.what())};
            }
        };

        // joined on destruction as well
        std::vector<std::jthread> workers;
        workers.reserve(stores.size());
        for (size_t i = 0; i < stores.size(); ++i)
        {
            try
            {
                workers.emplace_back(run, i);
            }
            catch (const std::system_error &e)
            {
                spdlog::warn("{}: cannot start worker ({}), validating inline",
                             to_string(stores[i].platform_version()), e.what());
                run(i);
            }
        }
        for (auto &t : workers)
            t.join();

        return results;
    }

    TrustResult Validator::validate_against_store(const CertChain &chain, const Store &store) const
    {
        TrustResult result;
        result.platform = store.platform_version();
        const auto label = to_string(result.platform);

        std::vector<const x509::Certificate *> roots;
        std::unordered_set<Fingerprint> missing;
        roots.reserve(store.fingerprints.size());
        for (const auto &fp : store.fingerprints)
        {
            if (const auto *cert = certs_.find(fp))
                roots.push_back(cert);
            else
                missing.insert(fp);
        }
        spdlog::debug("{}: {} roots resolved, {} missing", label, roots.size(), missing.size());

        if (roots.empty())
        {
            result.failure_reason = kNoValidRoots;
            return result;
        }

        const Timestamp now = clock_();
        auto outcome = verify_path(chain, roots, now);
        if (!outcome)
        {
            result.failure_reason = outcome.error().what();
            return result;
        }

        if (!outcome->ok)
        {
            // Only the last certificate the server sent is considered
            if (!chain.intermediates.empty())
            {
                auto fp = Fingerprint::from_certificate(chain.intermediates.back());
                if (missing.contains(fp))
                {
                    result.failure_reason = std::format(
                        "chain roots at known CA (fingerprint {}) but certificate data unavailable", fp.to_string());
                    return result;
                }
            }
            result.failure_reason = classify_verify_error(outcome->error, chain.endpoint, outcome->detail);
            spdlog::debug("{}: verification failed: {}", label, result.failure_reason);
            return result;
        }

        result.verified_chain = std::move(outcome->chain);
        if (!result.verified_chain.empty())
        {
            const auto &root = result.verified_chain.back();
            result.matched_ca = root.display_name();

            auto constraints = store.constraint_for(Fingerprint::from_certificate(root));
            if (auto violation = check_constraints(chain, constraints, now))
            {
                spdlog::debug("{}: constraint violated: {}", label, *violation);
                result.failure_reason = std::move(*violation);
                return result;
            }
        }

        result.trusted = true;
        return result;
    }

    std::optional<std::string> Validator::check_constraints(const CertChain &chain,
                                                            const Constraints &constraints,
                                                            Timestamp now)
    {
        if (constraints.is_empty())
            return std::nullopt;

        if (constraints.not_before_max && chain.leaf.not_before() > *constraints.not_before_max)
        {
            return std::format("certificate issued after trust cutoff ({} > {})",
                               format_date(chain.leaf.not_before()),
                               format_date(*constraints.not_before_max));
        }

        // Evaluated against validation time, not issuance time
        if (constraints.distrust_date && now > *constraints.distrust_date)
        {
            return std::format("CA distrusted since {}", format_date(*constraints.distrust_date));
        }

        if (constraints.sct_not_after)
        {
            const auto deadline = *constraints.sct_not_after;
            if (chain.scts.empty())
            {
                return std::format("SCT required but none found (deadline: {})", format_date(deadline));
            }
            bool any_in_time = std::any_of(chain.scts.begin(), chain.scts.end(),
                                           [&](const SCT &s) { return s.timestamp <= deadline; });
            if (!any_in_time)
            {
                return std::format("all SCTs issued after deadline ({})", format_date(deadline));
            }
        }
        return std::nullopt;
    }

    Result<std::vector<TrustResult>> validate(const CertChain &chain,
                                              const TrustStoreSnapshot &snapshot,
                                              const std::optional<std::string> &filter_expr,
                                              Clock clock)
    {
        std::optional<filter::Filter> filter;
        if (filter_expr)
        {
            auto parsed = filter::Filter::parse(*filter_expr);
            if (!parsed)
                return std::unexpected(parsed.error());
            filter = std::move(*parsed);
        }

        auto stores = filter::filter_stores(snapshot.stores(), filter);
        if (stores.empty())
        {
            return std::unexpected(CertvetError::no_stores("no trust stores match filter"));
        }
        spdlog::info("validating {} against {} trust stores", chain.endpoint, stores.size());

        Validator validator(snapshot.registry(), std::move(clock));
        return validator.validate_chain(chain, stores);
    }

    void sort_results(std::vector<TrustResult> &results)
    {
        std::stable_sort(results.begin(), results.end(), [](const TrustResult &a, const TrustResult &b) {
            auto pa = platform_to_string(a.platform.platform);
            auto pb = platform_to_string(b.platform.platform);
            if (pa != pb)
                return pa < pb;
            return version::less_than(a.platform.version, b.platform.version);
        });
    }

} // namespace certvet
