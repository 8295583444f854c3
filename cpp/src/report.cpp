#include "certvet/report.hpp"
#include "certvet/validator.hpp"
#include "certvet/version.hpp"
#include <algorithm>
#include <sstream>

namespace certvet::report
{

    void TableWriter::row(std::vector<std::string> values)
    {
        rows_.push_back(std::move(values));
    }

    std::string TableWriter::str() const
    {
        if (rows_.empty())
            return "";

        std::vector<size_t> widths;
        for (const auto &r : rows_)
        {
            if (widths.size() < r.size())
                widths.resize(r.size(), 0);
            for (size_t i = 0; i < r.size(); ++i)
                widths[i] = std::max(widths[i], r[i].size());
        }

        std::ostringstream oss;
        for (size_t n = 0; n < rows_.size(); ++n)
        {
            const auto &r = rows_[n];
            for (size_t i = 0; i < r.size(); ++i)
            {
                oss << r[i];
                if (i + 1 < r.size())
                    oss << std::string(widths[i] - r[i].size() + kPadding, ' ');
            }
            if (n + 1 < rows_.size())
                oss << '\n';
        }
        return oss.str();
    }

    ValidationReport build_report(std::string endpoint,
                                  CertChain chain,
                                  std::vector<TrustResult> results,
                                  std::string tool_version,
                                  Timestamp timestamp)
    {
        sort_results(results);
        bool all_passed = std::all_of(results.begin(), results.end(),
                                      [](const TrustResult &r) { return r.trusted; });
        return ValidationReport{
            std::move(endpoint),
            timestamp,
            std::move(tool_version),
            std::move(chain),
            std::move(results),
            all_passed};
    }

    std::string validation_text(const ValidationReport &report)
    {
        TableWriter tw;
        tw.header({"PLATFORM", "VERSION", "VALIDATION", "STATUS"});
        for (const auto &r : report.results)
        {
            tw.row({platform_to_string(r.platform.platform),
                    r.platform.version,
                    r.trusted ? "PASS" : "FAIL",
                    r.trusted ? r.matched_ca : r.failure_reason});
        }
        return tw.str();
    }

    nlohmann::json validation_json(const ValidationReport &report)
    {
        nlohmann::json j;
        j["endpoint"] = report.endpoint;
        j["timestamp"] = format_rfc3339(report.timestamp);
        j["tool_version"] = report.tool_version;

        if (report.chain)
        {
            const auto &leaf = report.chain->leaf;
            j["certificate"] = {
                {"subject", leaf.subject_common_name()},
                {"issuer", leaf.issuer_common_name()},
                {"expires", format_rfc3339(leaf.not_after())},
                {"fingerprint_sha256", Fingerprint::from_certificate(leaf).to_string()}};
        }

        nlohmann::json results = nlohmann::json::array();
        for (const auto &r : report.results)
        {
            nlohmann::json jr = {
                {"platform", platform_to_string(r.platform.platform)},
                {"version", r.platform.version},
                {"trusted", r.trusted}};
            if (!r.matched_ca.empty())
                jr["matched_ca"] = r.matched_ca;
            if (!r.failure_reason.empty())
                jr["failure_reason"] = r.failure_reason;
            results.push_back(std::move(jr));
        }
        j["results"] = std::move(results);
        j["all_passed"] = report.all_passed;
        return j;
    }

    std::string format_constraints(const Constraints &c)
    {
        std::string out;
        auto append = [&out](const char *tag, const std::optional<Timestamp> &ts) {
            if (!ts)
                return;
            if (!out.empty())
                out += ',';
            out += tag;
            out += format_date(*ts);
        };
        append("NB:", c.not_before_max);
        append("DT:", c.distrust_date);
        append("SCT:", c.sct_not_after);
        return out;
    }

    std::vector<ListEntry> build_list_entries(const std::vector<Store> &stores,
                                              const CertificateLookup &certs,
                                              bool full_fingerprints)
    {
        std::vector<ListEntry> entries;
        for (const auto &store : stores)
        {
            for (const auto &fp : store.fingerprints)
            {
                std::string issuer = "-";
                if (const auto *cert = certs.find(fp))
                {
                    auto name = cert->display_name();
                    if (!name.empty())
                        issuer = std::move(name);
                }

                entries.push_back(ListEntry{
                    platform_to_string(store.platform),
                    store.version,
                    full_fingerprints ? fp.to_string() : fp.truncate(4),
                    std::move(issuer),
                    format_constraints(store.constraint_for(fp))});
            }
        }
        return entries;
    }

    void sort_entries(std::vector<ListEntry> &entries)
    {
        std::stable_sort(entries.begin(), entries.end(), [](const ListEntry &a, const ListEntry &b) {
            if (a.platform != b.platform)
                return a.platform < b.platform;
            if (a.version != b.version)
                return version::less_than(a.version, b.version);
            return a.issuer < b.issuer;
        });
    }

    std::string list_text(std::vector<ListEntry> entries)
    {
        if (entries.empty())
            return "";
        sort_entries(entries);

        TableWriter tw;
        tw.header({"PLATFORM", "VERSION", "FINGERPRINT", "CONSTRAINTS", "ISSUER"});
        for (const auto &e : entries)
        {
            tw.row({e.platform,
                    e.version,
                    e.fingerprint,
                    e.constraints.empty() ? "-" : e.constraints,
                    e.issuer});
        }
        return tw.str();
    }

    nlohmann::json list_json(std::vector<ListEntry> entries)
    {
        sort_entries(entries);
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &e : entries)
        {
            nlohmann::json j = {
                {"platform", e.platform},
                {"version", e.version},
                {"fingerprint", e.fingerprint},
                {"issuer", e.issuer}};
            if (!e.constraints.empty())
                j["constraints"] = e.constraints;
            arr.push_back(std::move(j));
        }
        return arr;
    }

} // namespace certvet::report
