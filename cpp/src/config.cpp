#include "certvet/config.hpp"
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

#include <toml++/toml.h>

namespace certvet
{
    namespace
    {
        Result<std::chrono::seconds> parse_timeout(int64_t seconds)
        {
            if (seconds <= 0)
            {
                return std::unexpected(CertvetError::config(std::format("timeout must be positive, got {}", seconds)));
            }
            return std::chrono::seconds(seconds);
        }

        Result<CertvetConfig> parse_toml(const toml::table &tbl, CertvetConfig cfg)
        {
            if (auto level = tbl["log_level"].value<std::string>())
                cfg.log_level = *level;

            if (auto data = tbl["data"].as_table())
            {
                if (auto path = (*data)["certificates"].value<std::string>())
                    cfg.data.certificates_path = *path;
                if (auto path = (*data)["stores"].value<std::string>())
                    cfg.data.stores_path = *path;
            }

            if (auto fetch = tbl["fetch"].as_table())
            {
                if (auto secs = (*fetch)["timeout_seconds"].value<int64_t>())
                {
                    auto timeout = parse_timeout(*secs);
                    if (!timeout)
                        return std::unexpected(timeout.error());
                    cfg.fetch.timeout = *timeout;
                }
            }

            if (auto output = tbl["output"].as_table())
            {
                if (auto fmt = (*output)["format"].value<std::string>())
                {
                    auto parsed = output_format_from_string(*fmt);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.output.format = *parsed;
                }
            }

            return cfg;
        }
    } // namespace

    Result<OutputFormat> output_format_from_string(const std::string &s)
    {
        if (s == "text")
            return OutputFormat::Text;
        if (s == "json")
            return OutputFormat::JSON;
        return std::unexpected(CertvetError::config(std::format("Invalid output format: {}", s)));
    }

    Result<CertvetConfig> ConfigLoader::defaults()
    {
        CertvetConfig cfg{};
        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<CertvetConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(CertvetError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<CertvetConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        CertvetConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(CertvetError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(CertvetConfig &cfg)
    {
        if (const char *path = std::getenv("CERTVET_CERTIFICATES"))
            cfg.data.certificates_path = path;
        if (const char *path = std::getenv("CERTVET_STORES"))
            cfg.data.stores_path = path;
        if (const char *level = std::getenv("CERTVET_LOG_LEVEL"))
            cfg.log_level = level;

        if (const char *t = std::getenv("CERTVET_TIMEOUT"))
        {
            std::string_view sv(t);
            int64_t secs = 0;
            auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), secs);
            if (ec != std::errc() || ptr != sv.data() + sv.size())
            {
                return std::unexpected(CertvetError::config(std::format("Invalid CERTVET_TIMEOUT: {}", sv)));
            }
            auto timeout = parse_timeout(secs);
            if (!timeout)
                return std::unexpected(timeout.error());
            cfg.fetch.timeout = *timeout;
        }

        if (const char *fmt = std::getenv("CERTVET_OUTPUT"))
        {
            auto parsed = output_format_from_string(fmt);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.output.format = *parsed;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const CertvetConfig &cfg)
    {
        nlohmann::json j;
        j["data"] = {
            {"certificates", cfg.data.certificates_path},
            {"stores", cfg.data.stores_path}};
        j["fetch"] = {{"timeout_seconds", cfg.fetch.timeout.count()}};
        j["output"] = {{"format", cfg.output.format == OutputFormat::JSON ? "json" : "text"}};
        j["log_level"] = cfg.log_level;
        return j;
    }

} // namespace certvet
