#include "certvet/trust_store.hpp"
#include "certvet/version.hpp"
#include <format>
#include <unordered_set>

namespace certvet
{
    namespace
    {
        // Sanity window for upstream constraint dates
        const Timestamp kMinConstraintDate = std::chrono::sys_days(std::chrono::year{2000} / 1 / 1);
        const Timestamp kMaxConstraintDate = std::chrono::sys_days(std::chrono::year{2100} / 1 / 1);

        void check_date(const Store &store,
                        const Fingerprint &fp,
                        const char *field,
                        const std::optional<Timestamp> &date,
                        std::vector<QualityIssue> &issues)
        {
            if (!date)
                return;
            if (*date < kMinConstraintDate || *date >= kMaxConstraintDate)
            {
                issues.push_back({store.platform_version(),
                                  std::format("{}: {} {} outside reasonable range",
                                              fp.truncate(4), field, format_date(*date))});
            }
        }

        bool valid_version_format(const std::string &v)
        {
            if (version::is_current(v))
                return true;
            if (v.empty() || v.front() == '.' || v.back() == '.')
                return false;
            bool prev_dot = false;
            for (char c : v)
            {
                if (c == '.')
                {
                    if (prev_dot)
                        return false;
                    prev_dot = true;
                }
                else if (c >= '0' && c <= '9')
                {
                    prev_dot = false;
                }
                else
                {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    Constraints Store::constraint_for(const Fingerprint &fp) const
    {
        auto it = constraints.find(fp);
        if (it == constraints.end())
            return {};
        return it->second;
    }

    Fingerprint CertificateRegistry::add(x509::Certificate cert)
    {
        auto fp = Fingerprint::from_certificate(cert);
        add(fp, std::move(cert));
        return fp;
    }

    void CertificateRegistry::add(const Fingerprint &fp, x509::Certificate cert)
    {
        certs_.insert_or_assign(fp, std::move(cert));
    }

    const x509::Certificate *CertificateRegistry::find(const Fingerprint &fp) const
    {
        auto it = certs_.find(fp);
        if (it == certs_.end())
            return nullptr;
        return &it->second;
    }

    TrustStoreSnapshot::TrustStoreSnapshot(std::vector<Store> stores, CertificateRegistry registry)
        : stores_(std::move(stores)), registry_(std::move(registry))
    {
    }

    std::vector<QualityIssue> TrustStoreSnapshot::check_quality() const
    {
        std::vector<QualityIssue> issues;
        std::unordered_set<Fingerprint> used;

        for (const auto &store : stores_)
        {
            if (!valid_version_format(store.version))
            {
                issues.push_back({store.platform_version(),
                                  std::format("invalid version format: \"{}\"", store.version)});
            }

            std::unordered_set<Fingerprint> seen;
            for (const auto &fp : store.fingerprints)
            {
                used.insert(fp);
                if (!seen.insert(fp).second)
                {
                    issues.push_back({store.platform_version(),
                                      std::format("duplicate entry: {}", fp.truncate(4))});
                }
            }

            for (const auto &[fp, c] : store.constraints)
            {
                check_date(store, fp, "NotBeforeMax", c.not_before_max, issues);
                check_date(store, fp, "DistrustDate", c.distrust_date, issues);
                check_date(store, fp, "SCTNotAfter", c.sct_not_after, issues);
            }
        }

        for (const auto &[fp, _] : registry_.entries())
        {
            if (!used.contains(fp))
            {
                issues.push_back({std::nullopt, std::format("orphaned certificate not used by any store: {}", fp.truncate(4))});
            }
        }
        return issues;
    }

} // namespace certvet
