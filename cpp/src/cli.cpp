#include "certvet/cli.hpp"
#include "certvet/config.hpp"
#include "certvet/fetcher.hpp"
#include "certvet/filter.hpp"
#include "certvet/report.hpp"
#include "certvet/store_loader.hpp"
#include "certvet/validator.hpp"
#include <iostream>
#include <optional>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifndef CERTVET_VERSION
#define CERTVET_VERSION "dev"
#endif

namespace certvet::cli
{
    namespace
    {
        int fail(const CertvetError &err)
        {
            std::cerr << "Error: " << err.what() << std::endl;
            return kExitInputError;
        }

        Result<void> setup_logging(const CertvetConfig &cfg, bool verbose)
        {
            auto level = spdlog::level::from_str(cfg.log_level);
            if (level == spdlog::level::off && cfg.log_level != "off")
            {
                return std::unexpected(CertvetError::config("Invalid log level: " + cfg.log_level));
            }
            if (verbose)
                level = spdlog::level::debug;

            // stdout carries reports only
            auto logger = spdlog::stderr_color_mt("certvet");
            logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v");
            logger->set_level(level);
            spdlog::set_default_logger(logger);
            return {};
        }

        Result<std::optional<filter::Filter>> parse_filter(const CLI::Option *opt, const std::string &expr)
        {
            if (opt->count() == 0)
                return std::optional<filter::Filter>{};
            auto parsed = filter::Filter::parse(expr);
            if (!parsed)
                return std::unexpected(parsed.error());
            return std::optional<filter::Filter>(std::move(*parsed));
        }
    } // namespace

    int run(int argc, char *argv[])
    {
        CLI::App app{"certvet - check TLS certificate trust across platform root stores"};
        app.require_subcommand(1);

        std::string config_path;
        bool verbose{false};
        app.add_option("--config", config_path, "Path to config TOML");
        app.add_flag("-v,--verbose", verbose, "Debug logging on stderr");

        std::string endpoint;
        std::string validate_filter;
        bool validate_json{false};
        int timeout_seconds{0};
        auto validate_cmd = app.add_subcommand("validate", "Check certificate trust for an endpoint");
        validate_cmd->add_option("endpoint", endpoint, "host or host:port (default port 443)")->required();
        auto validate_filter_opt = validate_cmd->add_option("-f,--filter", validate_filter,
                                                            "Filter expression (e.g. ios>=15,android>=10)");
        validate_cmd->add_flag("-j,--json", validate_json, "Output in JSON format");
        auto timeout_opt = validate_cmd->add_option("--timeout", timeout_seconds, "Connection timeout in seconds")
                               ->check(CLI::PositiveNumber);

        std::string list_filter;
        bool list_json{false};
        bool list_wide{false};
        auto list_cmd = app.add_subcommand("list", "List trust store entries");
        auto list_filter_opt = list_cmd->add_option("-f,--filter", list_filter,
                                                    "Filter expression (e.g. ios>=15,android>=10)");
        list_cmd->add_flag("-j,--json", list_json, "Output in JSON format");
        list_cmd->add_flag("-w,--wide", list_wide, "Display full fingerprints without truncation");

        bool version_json{false};
        auto version_cmd = app.add_subcommand("version", "Show version");
        version_cmd->add_flag("-j,--json", version_json, "Output in JSON format");

        auto cfg_cmd = app.add_subcommand("config-print", "Print the effective config as JSON");

        try
        {
            app.parse(argc, argv);
        }
        catch (const CLI::ParseError &e)
        {
            int rc = app.exit(e);
            return rc == 0 ? kExitOK : kExitInputError;
        }

        if (*version_cmd)
        {
            if (version_json)
                std::cout << nlohmann::json{{"version", CERTVET_VERSION}}.dump() << std::endl;
            else
                std::cout << "certvet " << CERTVET_VERSION << std::endl;
            return kExitOK;
        }

        auto cfg = config_path.empty() ? ConfigLoader::defaults() : ConfigLoader::load(config_path);
        if (!cfg)
            return fail(cfg.error());
        if (auto res = setup_logging(*cfg, verbose); !res)
            return fail(res.error());

        if (*cfg_cmd)
        {
            std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
            return kExitOK;
        }

        auto snapshot = StoreLoader::load(cfg->data.certificates_path, cfg->data.stores_path);
        if (!snapshot)
            return fail(snapshot.error());
        for (const auto &issue : snapshot->check_quality())
        {
            spdlog::debug("data quality: {}{}", issue.store ? to_string(*issue.store) + ": " : "", issue.message);
        }

        if (*list_cmd)
        {
            auto filter = parse_filter(list_filter_opt, list_filter);
            if (!filter)
                return fail(filter.error());

            bool as_json = list_json || cfg->output.format == OutputFormat::JSON;
            auto stores = filter::filter_stores(snapshot->stores(), *filter);
            auto entries = report::build_list_entries(stores, snapshot->registry(), as_json || list_wide);
            if (entries.empty())
                return kExitOK;

            if (as_json)
                std::cout << report::list_json(std::move(entries)).dump(2) << std::endl;
            else
                std::cout << report::list_text(std::move(entries)) << std::endl;
            return kExitOK;
        }

        if (*validate_cmd)
        {
            // Reject bad filters before touching the network
            auto filter = parse_filter(validate_filter_opt, validate_filter);
            if (!filter)
                return fail(filter.error());

            auto timeout = timeout_opt->count() > 0 ? std::chrono::seconds(timeout_seconds) : cfg->fetch.timeout;
            auto chain = Fetcher::fetch(endpoint, timeout);
            if (!chain)
                return fail(chain.error());

            std::optional<std::string> expr;
            if (validate_filter_opt->count() > 0)
                expr = validate_filter;
            auto results = validate(*chain, *snapshot, expr);
            if (!results)
                return fail(results.error());

            auto rep = report::build_report(endpoint, std::move(*chain), std::move(*results),
                                            CERTVET_VERSION, system_now());
            if (validate_json || cfg->output.format == OutputFormat::JSON)
                std::cout << report::validation_json(rep).dump(2) << std::endl;
            else
                std::cout << report::validation_text(rep) << std::endl;

            return rep.all_passed ? kExitOK : kExitTrustFail;
        }

        std::cout << app.help() << std::endl;
        return kExitOK;
    }

} // namespace certvet::cli
