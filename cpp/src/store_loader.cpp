#include "certvet/store_loader.hpp"
#include <format>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace certvet
{
    namespace
    {
        std::string unescape_newlines(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size(); ++i)
            {
                if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == 'n')
                {
                    out.push_back('\n');
                    ++i;
                }
                else
                {
                    out.push_back(s[i]);
                }
            }
            return out;
        }

        Result<std::optional<Timestamp>> optional_date(const std::vector<std::string> &record,
                                                       size_t column,
                                                       const char *name)
        {
            if (record.size() <= column || record[column].empty())
                return std::optional<Timestamp>{};
            auto ts = parse_rfc3339(record[column]);
            if (!ts)
            {
                return std::unexpected(CertvetError::data(
                    std::format("parse {} {}: {}", name, record[column], ts.error().what())));
            }
            return std::optional<Timestamp>(*ts);
        }

        struct StoreBuilder
        {
            Store store;
            std::unordered_set<Fingerprint> seen;
        };
    } // namespace

    Result<std::vector<std::vector<std::string>>> StoreLoader::read_csv(std::istream &in)
    {
        std::vector<std::vector<std::string>> records;
        std::vector<std::string> record;
        std::string field;
        bool in_quotes = false;
        bool field_started = false;
        char c = 0;

        auto end_field = [&]() {
            record.push_back(std::move(field));
            field.clear();
            field_started = false;
        };
        auto end_record = [&]() {
            end_field();
            // Skip blank lines
            if (!(record.size() == 1 && record[0].empty()))
                records.push_back(std::move(record));
            record.clear();
        };

        while (in.get(c))
        {
            if (in_quotes)
            {
                if (c == '"')
                {
                    if (in.peek() == '"')
                    {
                        in.get(c);
                        field.push_back('"');
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    field.push_back(c);
                }
                continue;
            }

            switch (c)
            {
            case '"':
                if (field_started)
                    return std::unexpected(CertvetError::data(
                        std::format("bare \" in non-quoted field on record {}", records.size() + 1)));
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                break;
            default:
                field.push_back(c);
                field_started = true;
                break;
            }
        }

        if (in_quotes)
            return std::unexpected(CertvetError::data("unterminated quoted field"));
        if (field_started || !record.empty())
            end_record();
        return records;
    }

    Result<CertificateRegistry> StoreLoader::load_certificates(std::istream &in)
    {
        auto records = read_csv(in);
        if (!records)
            return std::unexpected(records.error());
        if (records->empty())
            return std::unexpected(CertvetError::data("read header: certificates file is empty"));

        CertificateRegistry registry;
        for (size_t i = 1; i < records->size(); ++i)
        {
            const auto &record = (*records)[i];
            if (record.size() < 2)
            {
                return std::unexpected(CertvetError::data(
                    std::format("certificate record {}: expected 2 fields, got {}", i, record.size())));
            }

            const auto &fp_str = record[0];
            auto fp = Fingerprint::parse(fp_str);
            if (!fp)
            {
                return std::unexpected(CertvetError::data(
                    std::format("parse fingerprint {}: {}", fp_str, fp.error().what())));
            }

            auto cert = x509::Certificate::from_pem(unescape_newlines(record[1]));
            if (!cert)
            {
                return std::unexpected(CertvetError::data(
                    std::format("failed to parse cert {}: {}", fp_str, cert.error().what())));
            }
            registry.add(*fp, std::move(*cert));
        }
        spdlog::info("loaded {} certificates", registry.size());
        return registry;
    }

    Result<std::vector<Store>> StoreLoader::load_stores(std::istream &in)
    {
        auto records = read_csv(in);
        if (!records)
            return std::unexpected(records.error());
        if (records->empty())
            return std::unexpected(CertvetError::data("read header: stores file is empty"));

        std::vector<StoreBuilder> builders;
        std::unordered_map<std::string, size_t> index;

        for (size_t i = 1; i < records->size(); ++i)
        {
            const auto &record = (*records)[i];
            if (record.size() < 3)
            {
                return std::unexpected(CertvetError::data(
                    std::format("store record {}: expected at least 3 fields, got {}", i, record.size())));
            }

            auto platform = platform_from_string(record[0]);
            if (!platform)
            {
                return std::unexpected(CertvetError::data(
                    std::format("store record {}: {}", i, platform.error().what())));
            }
            const auto &version = record[1];

            auto fp = Fingerprint::parse(record[2]);
            if (!fp)
            {
                return std::unexpected(CertvetError::data(
                    std::format("parse fingerprint {}: {}", record[2], fp.error().what())));
            }

            Constraints constraints;
            auto nbm = optional_date(record, 3, "not_before_max");
            if (!nbm)
                return std::unexpected(nbm.error());
            auto dd = optional_date(record, 4, "distrust_date");
            if (!dd)
                return std::unexpected(dd.error());
            auto sna = optional_date(record, 5, "sct_not_after");
            if (!sna)
                return std::unexpected(sna.error());
            constraints.not_before_max = *nbm;
            constraints.distrust_date = *dd;
            constraints.sct_not_after = *sna;

            auto key = std::format("{}\x1f{}", platform_to_string(*platform), version);
            auto [it, inserted] = index.try_emplace(key, builders.size());
            if (inserted)
            {
                StoreBuilder b;
                b.store.platform = *platform;
                b.store.version = version;
                builders.push_back(std::move(b));
            }

            auto &builder = builders[it->second];
            if (!builder.seen.insert(*fp).second)
            {
                spdlog::warn("{}/{}: duplicate entry {} ignored", record[0], version, fp->truncate(4));
                continue;
            }
            builder.store.fingerprints.push_back(*fp);
            if (!constraints.is_empty())
                builder.store.constraints.emplace(*fp, constraints);
        }

        std::vector<Store> stores;
        stores.reserve(builders.size());
        for (auto &b : builders)
            stores.push_back(std::move(b.store));
        spdlog::info("loaded {} trust stores", stores.size());
        return stores;
    }

    Result<TrustStoreSnapshot> StoreLoader::load(const std::string &certificates_path, const std::string &stores_path)
    {
        std::ifstream certs_file(certificates_path);
        if (!certs_file.is_open())
        {
            return std::unexpected(CertvetError::io("Unable to open certificates file: " + certificates_path));
        }
        auto registry = load_certificates(certs_file);
        if (!registry)
            return std::unexpected(registry.error());

        std::ifstream stores_file(stores_path);
        if (!stores_file.is_open())
        {
            return std::unexpected(CertvetError::io("Unable to open stores file: " + stores_path));
        }
        auto stores = load_stores(stores_file);
        if (!stores)
            return std::unexpected(stores.error());

        return TrustStoreSnapshot(std::move(*stores), std::move(*registry));
    }

} // namespace certvet
