#pragma once

#include "trust_store.hpp"
#include "types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace certvet
{

    /**
     * Builds a TrustStoreSnapshot from the two persisted record sets.
     *
     * certificates.csv: fingerprint,pem  (PEM newlines stored as literal "\n")
     * stores.csv:       platform,version,fingerprint,not_before_max,distrust_date,sct_not_after
     *
     * Both files start with a header row. Any malformed record is a hard
     * DataError; partial snapshots are never returned.
     */
    class StoreLoader
    {
    public:
        static Result<CertificateRegistry> load_certificates(std::istream &in);

        static Result<std::vector<Store>> load_stores(std::istream &in);

        /** Open and load both files. */
        static Result<TrustStoreSnapshot> load(const std::string &certificates_path, const std::string &stores_path);

        /** Split one CSV document into records (RFC 4180 quoting). */
        static Result<std::vector<std::vector<std::string>>> read_csv(std::istream &in);
    };

} // namespace certvet
