#pragma once

#include "types.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace certvet
{

    struct DataConfig
    {
        std::string certificates_path{"./data/certificates.csv"};
        std::string stores_path{"./data/stores.csv"};
    };

    struct FetchConfig
    {
        std::chrono::seconds timeout{10};
    };

    enum class OutputFormat
    {
        Text,
        JSON
    };

    struct OutputConfig
    {
        OutputFormat format{OutputFormat::Text};
    };

    struct CertvetConfig
    {
        DataConfig data{};
        FetchConfig fetch{};
        OutputConfig output{};
        std::string log_level{"warn"};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides
     * (CERTVET_CERTIFICATES, CERTVET_STORES, CERTVET_TIMEOUT,
     * CERTVET_OUTPUT, CERTVET_LOG_LEVEL).
     */
    class ConfigLoader
    {
    public:
        /** Defaults plus environment overrides, no file. */
        static Result<CertvetConfig> defaults();

        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<CertvetConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<CertvetConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const CertvetConfig &cfg);

    private:
        static Result<void> apply_env_overrides(CertvetConfig &cfg);
    };

    Result<OutputFormat> output_format_from_string(const std::string &s);

} // namespace certvet
