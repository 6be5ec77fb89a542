#include "core/cancellation_token.hpp"
#include "core/duplicate_scan_orchestrator.hpp"
#include "core/json_media_catalog.hpp"
#include "core/poco_config_manager.hpp"
#include "core/scan_job.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>
#include <string>

namespace
{
    const int EXIT_OK = 0;
    const int EXIT_USAGE = 1;
    const int EXIT_SCAN_FAILED = 2;

    struct CommandLine
    {
        std::string catalog_path;
        std::string config_path;
        std::string db_path;
        std::string collection_id;
        std::string log_level;
        bool dry_run = false;
        bool help = false;
    };

    void printUsage(std::ostream &out, const char *program)
    {
        out << "Media Dedup - duplicate detection for media catalogs" << std::endl;
        out << "Usage: " << program << " --catalog <file> [options]" << std::endl;
        out << "Options:" << std::endl;
        out << "  --catalog <file>      JSON catalog export to scan (required)" << std::endl;
        out << "  --config <file>       JSON configuration file" << std::endl;
        out << "  --db <file>           SQLite database (overrides database_path)" << std::endl;
        out << "  --collection <id>     Scan only this collection" << std::endl;
        out << "  --dry-run             Detect and rank without storing results" << std::endl;
        out << "  --log-level <level>   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        out << "  --help, -h            Show this help message" << std::endl;
    }

    bool parseArguments(int argc, char *argv[], CommandLine &cmd, std::string &error)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                cmd.help = true;
                return true;
            }
            if (arg == "--dry-run")
            {
                cmd.dry_run = true;
                continue;
            }

            std::string *target = nullptr;
            if (arg == "--catalog")
                target = &cmd.catalog_path;
            else if (arg == "--config")
                target = &cmd.config_path;
            else if (arg == "--db")
                target = &cmd.db_path;
            else if (arg == "--collection")
                target = &cmd.collection_id;
            else if (arg == "--log-level")
                target = &cmd.log_level;
            else
            {
                error = "Unknown option: " + arg;
                return false;
            }

            if (i + 1 >= argc)
            {
                error = "Missing value for " + arg;
                return false;
            }
            *target = argv[++i];
        }

        if (cmd.catalog_path.empty())
        {
            error = "--catalog is required";
            return false;
        }
        return true;
    }

    int exitCodeFor(const ScanJob &job)
    {
        return job.status == "Completed" ? EXIT_OK : EXIT_SCAN_FAILED;
    }
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    std::string error;
    if (!parseArguments(argc, argv, cmd, error))
    {
        std::cerr << "Error: " << error << std::endl;
        printUsage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }
    if (cmd.help)
    {
        printUsage(std::cout, argv[0]);
        return EXIT_OK;
    }

    Logger::init(cmd.log_level.empty() ? "INFO" : cmd.log_level);

    PocoConfigManager config;
    if (!cmd.config_path.empty() && !config.load(cmd.config_path))
    {
        Logger::error("Failed to load configuration: " + cmd.config_path);
        return EXIT_USAGE;
    }

    Logger::setLevel(cmd.log_level.empty() ? config.getLogLevel() : cmd.log_level);

    auto problems = config.validate();
    if (!problems.empty())
    {
        for (const auto &problem : problems)
            std::cerr << "Config error: " << problem << std::endl;
        return EXIT_USAGE;
    }

    if (cmd.dry_run)
        config.update({{"dry_run_mode", true}});

    try
    {
        JsonMediaCatalog catalog = JsonMediaCatalog::fromFile(cmd.catalog_path);
        Logger::info("Loaded catalog " + cmd.catalog_path + " with " + std::to_string(catalog.itemCount()) + " items");

        DatabaseManager store(cmd.db_path.empty() ? config.getDatabasePath() : cmd.db_path);
        if (!store.isValid())
        {
            Logger::error("Database unavailable: " + store.getPath());
            return EXIT_SCAN_FAILED;
        }

        CancellationToken token;
        CancellationToken::bindToSignals(token);

        DuplicateScanOrchestrator orchestrator(catalog, store, DuplicateScanOrchestrator::optionsFromConfig(config));
        ScanJob job = orchestrator.runScan(config, token, cmd.collection_id,
                                           [](int percent, const std::string &message)
                                           { Logger::info("[" + std::to_string(percent) + "%] " + message); });

        if (job.status == "Completed" && !config.isDryRunMode())
        {
            auto purge = store.purgeAuditRecordsOlderThan(config.getAuditRetentionDays());
            if (!purge.first.success)
                Logger::warn("Audit retention cleanup failed: " + purge.first.error_message);
        }

        std::cout << nlohmann::json(job).dump(2) << std::endl;
        return exitCodeFor(job);
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Scan aborted: ") + e.what());
        return EXIT_SCAN_FAILED;
    }
}
