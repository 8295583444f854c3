#pragma once

#include "chain.hpp"
#include "trust_store.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace certvet::report
{

    /**
     * Aligned plain-text table. Every column but the last is padded to its
     * widest cell plus three spaces.
     */
    class TableWriter
    {
    public:
        void header(std::vector<std::string> columns) { row(std::move(columns)); }
        void row(std::vector<std::string> values);

        /** Rendered table without a trailing newline; empty if nothing was written. */
        std::string str() const;

    private:
        static constexpr size_t kPadding = 3;
        std::vector<std::vector<std::string>> rows_;
    };

    /**
     * Assemble a report for one validate run. Results are sorted by
     * platform then version, and all_passed is derived from them.
     */
    ValidationReport build_report(std::string endpoint,
                                  CertChain chain,
                                  std::vector<TrustResult> results,
                                  std::string tool_version,
                                  Timestamp timestamp);

    /** PLATFORM VERSION VALIDATION STATUS table. */
    std::string validation_text(const ValidationReport &report);

    nlohmann::json validation_json(const ValidationReport &report);

    /** One (store, root) row of a trust store listing. */
    struct ListEntry
    {
        std::string platform;
        std::string version;
        std::string fingerprint;
        std::string issuer;
        std::string constraints; // empty when unconstrained
    };

    /** "NB:2024-01-01,DT:2025-01-01,SCT:2024-06-01", empty when unconstrained. */
    std::string format_constraints(const Constraints &c);

    /**
     * Flatten stores into listing rows. Fingerprints are truncated to four
     * octets unless `full_fingerprints` is set. The issuer is the root's
     * CN, else its first O, else "-".
     */
    std::vector<ListEntry> build_list_entries(const std::vector<Store> &stores,
                                              const CertificateLookup &certs,
                                              bool full_fingerprints);

    /** Platform, then version ordering, then issuer. */
    void sort_entries(std::vector<ListEntry> &entries);

    /** Sorted table, "-" for missing constraints; empty for no entries. */
    std::string list_text(std::vector<ListEntry> entries);

    /** Sorted JSON array; constraints omitted when empty. */
    nlohmann::json list_json(std::vector<ListEntry> entries);

} // namespace certvet::report
