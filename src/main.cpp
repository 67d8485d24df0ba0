#include "core/batch_pipeline.hpp"
#include "core/encoder_backend.hpp"
#include "core/media_probe.hpp"
#include "core/media_storage.hpp"
#include "core/pipeline_errors.hpp"
#include "core/poco_config_manager.hpp"
#include "core/process_runner.hpp"
#include "core/shutdown_manager.hpp"
#include "core/smmbox_client.hpp"
#include "core/variant_encoder.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitValidation = 2;
    constexpr int kExitNoEncoder = 3;

    const char *kDefaultConfigPath = "config/config.json";

    void printUsage(const char *program)
    {
        std::cout << "uniqcast - per-account video uniqueization and scheduled publishing" << std::endl;
        std::cout << "Usage:" << std::endl;
        std::cout << "  " << program << " publish --video <path> --accounts <file|-> --at <iso8601>" << std::endl;
        std::cout << "          [--caption <text>] [--seed <seed>] [--config <file>]" << std::endl;
        std::cout << "  " << program << " accounts [--config <file>]" << std::endl;
        std::cout << "  " << program << " probe [--config <file>]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --video      Source video (mp4, mov, avi, mkv)" << std::endl;
        std::cout << "  --accounts   JSON array of {\"id\", \"social\", \"type\"} objects, '-' reads stdin" << std::endl;
        std::cout << "  --at         Publish time; without a zone it is taken as Moscow time (UTC+3)" << std::endl;
        std::cout << "  --caption    Text posted with every video" << std::endl;
        std::cout << "  --seed       Batch seed for reproducible variants" << std::endl;
        std::cout << "  --config     Configuration file (default " << kDefaultConfigPath << ")" << std::endl;
        std::cout << "  --help, -h   Show this help message" << std::endl;
        std::cout << "Environment:" << std::endl;
        std::cout << "  SMMBOX_API_TOKEN overrides provider.api_token" << std::endl;
    }

    bool parseOptions(int argc, char *argv[], int first, std::map<std::string, std::string> &options)
    {
        for (int i = first; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0 || i + 1 >= argc)
            {
                std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
                return false;
            }
            options[arg.substr(2)] = argv[++i];
        }
        return true;
    }

    bool loadConfiguration(const std::map<std::string, std::string> &options)
    {
        auto &config = PocoConfigManager::getInstance();
        auto it = options.find("config");
        std::string path = it != options.end() ? it->second : kDefaultConfigPath;

        bool loaded = std::filesystem::exists(path) && config.load(path);
        Logger::init(config.getLogLevel(), config.getLogFile());
        if (!loaded)
        {
            if (it != options.end())
            {
                Logger::error("Cannot load configuration file " + path);
                return false;
            }
            Logger::info("No configuration at " + path + ", using built-in defaults");
        }
        else
        {
            Logger::info("Loaded configuration from " + path);
        }

        if (!config.validateConfig())
        {
            Logger::error("Configuration is invalid, see errors above");
            return false;
        }
        return true;
    }

    std::vector<AccountTarget> readTargets(const std::string &source)
    {
        nlohmann::json json;
        if (source == "-")
        {
            json = nlohmann::json::parse(std::cin, nullptr, false);
        }
        else
        {
            std::ifstream in(source);
            if (!in.good())
                throw ValidationError("cannot open accounts file " + source);
            json = nlohmann::json::parse(in, nullptr, false);
        }
        if (json.is_discarded())
            throw ValidationError("accounts input is not valid JSON");
        if (!json.is_array())
            throw ValidationError("accounts input must be a JSON array");

        std::vector<AccountTarget> targets;
        for (const auto &entry : json)
        {
            targets.push_back(AccountTarget::fromJson(entry));
        }
        return targets;
    }

    std::string maskToken(const std::string &token)
    {
        if (token.size() <= 8)
            return std::string(token.size(), '*');
        return token.substr(0, 4) + std::string(token.size() - 8, '*') + token.substr(token.size() - 4);
    }

    int runPublish(const std::map<std::string, std::string> &options)
    {
        for (const char *required : {"video", "accounts", "at"})
        {
            if (!options.count(required))
            {
                std::cerr << "Error: --" << required << " is required for publish" << std::endl;
                return kExitValidation;
            }
        }

        auto &config = PocoConfigManager::getInstance();
        PipelineSettings settings = PipelineSettings::fromConfig(config);
        Logger::debug("Using SmmBox token " + maskToken(settings.provider.api_token));

        auto runner = std::make_shared<PocoProcessRunner>();
        auto prober = std::make_shared<AvMediaProber>();
        auto capability = std::make_shared<EncoderCapability>(runner, settings.encoder);
        auto encoder = std::make_shared<VariantEncoder>(runner, prober, settings.encoder, settings.bounds);
        auto storage = std::make_shared<LocalDirectoryStorage>(config.getStorageConfig());
        auto provider = std::make_shared<SmmBoxClient>(settings.provider, settings.publish.request_timeout_seconds);
        BatchPipeline pipeline(prober, capability, encoder, storage, provider, settings);

        BatchRequest request;
        request.source_path = options.at("video");
        request.scheduled_at = options.at("at");
        if (options.count("caption"))
            request.caption = options.at("caption");
        if (options.count("seed"))
            request.seed = options.at("seed");

        CancellationSource cancellation;
        auto &shutdown = ShutdownManager::getInstance();
        int registration = shutdown.registerCancellation(cancellation);

        int exit_code = kExitOk;
        try
        {
            request.targets = readTargets(options.at("accounts"));
            BatchResult result = pipeline.run(request, cancellation.token());
            std::cout << result.toJson().dump(2) << std::endl;
        }
        catch (const ValidationError &e)
        {
            Logger::error(e.what());
            std::cerr << e.what() << std::endl;
            exit_code = kExitValidation;
        }
        catch (const NoEncoderAvailableError &e)
        {
            Logger::error(e.what());
            std::cerr << e.what() << std::endl;
            exit_code = kExitNoEncoder;
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("Batch failed: ") + e.what());
            std::cerr << "Batch failed: " << e.what() << std::endl;
            exit_code = kExitFailure;
        }
        shutdown.unregisterCancellation(registration);
        return exit_code;
    }

    int runAccounts()
    {
        auto &config = PocoConfigManager::getInstance();
        SmmBoxClient client(config.getProviderConfig(), config.getPublishConfig().request_timeout_seconds);
        try
        {
            auto grouped = AccountRegistry::groupByPlatform(client.listAccounts());
            nlohmann::json out = nlohmann::json::object();
            for (const auto &[platform, accounts] : grouped)
            {
                nlohmann::json list = nlohmann::json::array();
                for (const auto &account : accounts)
                    list.push_back(account.toJson());
                out[platformCode(platform)] = {{"name", platformDisplayName(platform)}, {"accounts", list}};
            }
            std::cout << out.dump(2) << std::endl;
            return kExitOk;
        }
        catch (const ProviderError &e)
        {
            Logger::error(std::string("Cannot list accounts: ") + e.what());
            std::cerr << e.what() << std::endl;
            return kExitFailure;
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("Unexpected error while listing accounts: ") + e.what());
            std::cerr << e.what() << std::endl;
            return kExitFailure;
        }
    }

    int runProbe()
    {
        auto &config = PocoConfigManager::getInstance();
        EncoderCapability capability(std::make_shared<PocoProcessRunner>(), config.getEncoderConfig());
        const CapabilityReport &report = capability.report();

        nlohmann::json out = {
            {"primary", report.primary ? report.primary->describe() : nullptr},
            {"software_fallback", report.software_fallback ? report.software_fallback->encoder_name : nullptr},
            {"probe_error", report.probe_error}};
        std::cout << out.dump(2) << std::endl;
        return report.hasAny() ? kExitOk : kExitNoEncoder;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return kExitValidation;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help")
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (command != "publish" && command != "accounts" && command != "probe")
    {
        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(argv[0]);
        return kExitValidation;
    }

    std::map<std::string, std::string> options;
    if (!parseOptions(argc, argv, 2, options))
    {
        printUsage(argv[0]);
        return kExitValidation;
    }

    if (!loadConfiguration(options))
    {
        return kExitFailure;
    }

    ShutdownManager::getInstance().installSignalHandlers();

    if (command == "publish")
        return runPublish(options);
    if (command == "accounts")
        return runAccounts();
    return runProbe();
}
