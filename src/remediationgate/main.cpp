#include "easylogging++.h"

#include "OllamaGenerationBackend.hpp"
#include "RemediationGateConfig.hpp"
#include "RemediationResult.hpp"
#include "ThreatCsvReader.hpp"
#include "api/DecisionEndpoints.hpp"
#include "api/RemediationHttpServer.hpp"
#include "audit/AuditLogFactory.hpp"
#include "policy/ApprovalGate.hpp"
#include "policy/BatchOrchestrator.hpp"
#include "policy/DestructiveClassifier.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef __GNUC__
#include <execinfo.h>
#include <unistd.h>
#endif

INITIALIZE_EASYLOGGINGPP

namespace {
constexpr std::chrono::milliseconds kHealthCheckTimeout{5000};

api::RemediationHttpServer* activeServer = nullptr;

void StopSignalHandler(int) {
    if (activeServer != nullptr) {
        activeServer->Stop();
    }
}
} // namespace

RemediationGateConfig BuildConfiguration(int argc, const char* argv[]);
int RunVerifyAudit(const RemediationGateConfig& config);
int RunService(const RemediationGateConfig& config);

#ifdef __GNUC__
void SignalHandler(int sig);
#endif

int main(int argc, const char* argv[]) {
#ifdef __GNUC__
    signal(SIGSEGV, SignalHandler);
#endif

    try {
        auto config = BuildConfiguration(argc, argv);

        el::Loggers::setDefaultConfigurations(config.loggerConfig, true);
        START_EASYLOGGINGPP(argc, argv);

        if (config.verifyAudit) {
            return RunVerifyAudit(config);
        }

        return RunService(config);
    } catch (const RemediationResultException& e) {
        LOG(ERROR) << ToString(e.Code()) << ": " << e.what();
        std::cerr << ToString(e.Code()) << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        LOG(ERROR) << "Startup failed: " << e.what();
        std::cerr << "Startup failed: " << e.what() << "\n";
    }

    return EXIT_FAILURE;
}

int RunVerifyAudit(const RemediationGateConfig& config) {
    auto auditLog = audit::CreateAuditLog(config);
    auto result = auditLog->VerifyChain();

    if (result.intact) {
        std::cout << auditLog->SinkName() << ": chain intact, " << result.entriesChecked << " entries\n";
        return EXIT_SUCCESS;
    }

    std::cout << auditLog->SinkName() << ": chain broken at sequence " << result.firstBrokenSequence << " ("
              << result.reason << ") after " << result.entriesChecked << " entries\n";
    return EXIT_FAILURE;
}

int RunService(const RemediationGateConfig& config) {
    auto auditLog = audit::CreateAuditLog(config);

    policy::DestructiveClassifier classifier{config.destructiveTerms};

    OllamaGenerationBackend backend{
        config.generationHost, config.generationPort, config.generationModel, ParseChatApi(config.generationApi)};

    if (config.generationHealthCheck) {
        backend.Ping(kHealthCheckTimeout);
        LOG(INFO) << "Generation backend reachable: " << backend.BackendName();
    }

    policy::ApprovalGate gate{
        &backend, auditLog.get(), &classifier, std::chrono::milliseconds{config.generationTimeoutMs}};
    policy::BatchOrchestrator orchestrator{&gate, config.batchConcurrency};

    if (!config.batchFile.empty()) {
        auto threats = ReadThreatCsvFile(config.batchFile);
        auto report = orchestrator.RunBatch(threats);
        std::cout << ToJson(report).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << "\n";
        return EXIT_SUCCESS;
    }

    api::DecisionEndpoints endpoints{&gate, &orchestrator, auditLog->SinkName(), backend.BackendName()};
    api::RemediationHttpServer server{
        config.listenAddress, config.listenPort, config.bindToIp, &endpoints, config.batchConcurrency};

    activeServer = &server;
    signal(SIGINT, StopSignalHandler);
    signal(SIGTERM, StopSignalHandler);

    server.Run();

    activeServer = nullptr;
    return EXIT_SUCCESS;
}

RemediationGateConfig BuildConfiguration(int argc, const char* argv[]) {
    namespace po = boost::program_options;
    RemediationGateConfig config;
    std::string configFile;
    std::string destructiveTerms;

    auto ResolveDefaultPath = [](const std::vector<std::string>& candidatePaths) {
        for (const auto& candidatePath : candidatePaths) {
            std::ifstream candidate(candidatePath.c_str());
            if (candidate.good()) {
                return candidatePath;
            }
        }

        return candidatePaths.empty() ? std::string{} : candidatePaths.front();
    };

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&configFile)->default_value("etc/remediationgate/remediationgate.cfg"),
            "sets path to the configuration file")
        ("logger_config", po::value<std::string>(&config.loggerConfig)->default_value("etc/remediationgate/logger.cfg"),
            "sets path to the logger configuration file")
        ("batch", po::value<std::string>(&config.batchFile),
            "decides every threat in the given CSV file, prints the report and exits")
        ("verify_audit", po::bool_switch(&config.verifyAudit),
            "recomputes the audit hash chain, reports the first broken entry and exits")
        ;

    po::options_description options("Configuration");
    options.add_options()
        ("listen_address", po::value<std::string>(&config.listenAddress)->default_value("127.0.0.1"),
            "address for decision requests")
        ("listen_port", po::value<uint16_t>(&config.listenPort)->default_value(8088),
            "port for decision requests")
        ("bind_to_ip", po::value<bool>(&config.bindToIp)->default_value(false),
            "when set to true, binds to the listen address; otherwise, binds on any interface")
        ("generation_host", po::value<std::string>(&config.generationHost)->default_value("127.0.0.1"),
            "host of the Ollama server")
        ("generation_port", po::value<uint16_t>(&config.generationPort)->default_value(11434),
            "port of the Ollama server")
        ("generation_api", po::value<std::string>(&config.generationApi)->default_value("native"),
            "chat api: native (/api/chat) or openai (/v1/chat/completions)")
        ("generation_model", po::value<std::string>(&config.generationModel)->default_value("gpt-oss:20b"),
            "model used for recommendations")
        ("generation_timeout_ms", po::value<uint32_t>(&config.generationTimeoutMs)->default_value(120000),
            "upper bound for one generation call in milliseconds")
        ("generation_health_check", po::value<bool>(&config.generationHealthCheck)->default_value(true),
            "when true, the generation backend must answer before requests are served")
        ("destructive_terms", po::value<std::string>(&destructiveTerms)->default_value("delete,remove,kill,uninstall,erase"),
            "comma separated words that mark a recommendation as destructive")
        ("batch_concurrency", po::value<uint32_t>(&config.batchConcurrency)->default_value(4),
            "worker threads for batch decisions and HTTP requests")
        ("audit_backend", po::value<std::string>(&config.auditBackend)->default_value("file"),
            "audit sink: file, sqlite or mariadb")
        ("audit_log_path", po::value<std::string>(&config.auditLogPath)->default_value("var/log/remediationgate/audit.log"),
            "audit file (used when audit_backend=file)")
        ("audit_database_path", po::value<std::string>(&config.auditDatabasePath)->default_value("var/lib/remediationgate/audit.db"),
            "audit database file (used when audit_backend=sqlite)")
        ("database_host", po::value<std::string>(&config.databaseHost)->default_value("127.0.0.1"),
            "database host (used when audit_backend=mariadb)")
        ("database_port", po::value<uint16_t>(&config.databasePort)->default_value(3306),
            "database port (used when audit_backend=mariadb)")
        ("database_user", po::value<std::string>(&config.databaseUser)->default_value(""),
            "database user (required when audit_backend=mariadb)")
        ("database_password", po::value<std::string>(&config.databasePassword)->default_value(""),
            "database password (used when audit_backend=mariadb; can be overridden by REMEDIATIONGATE_DB_PASSWORD)")
        ("database_schema", po::value<std::string>(&config.databaseSchema)->default_value(""),
            "database schema (required when audit_backend=mariadb)")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(options);

    po::options_description config_file_options;
    config_file_options.add(options);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cmdline_options).allow_unregistered().run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << cmdline_options << "\n";
        exit(EXIT_SUCCESS);
    }

    if (vm["config"].defaulted()) {
        configFile = ResolveDefaultPath({"remediationgate.cfg", configFile});
    }
    if (vm["logger_config"].defaulted()) {
        config.loggerConfig = ResolveDefaultPath({"logger.cfg", config.loggerConfig});
    }

    std::ifstream ifs(configFile.c_str());
    if (!ifs) {
        throw std::runtime_error("Cannot open configuration file: " + configFile);
    }

    po::store(po::parse_config_file(ifs, config_file_options), vm);
    po::notify(vm);

    const char* passwordFromEnv = std::getenv("REMEDIATIONGATE_DB_PASSWORD");
    if (passwordFromEnv != nullptr) {
        config.databasePassword = passwordFromEnv;
    }

    boost::algorithm::split(config.destructiveTerms, destructiveTerms, boost::algorithm::is_any_of(", "),
        boost::algorithm::token_compress_on);
    config.destructiveTerms.erase(std::remove(config.destructiveTerms.begin(), config.destructiveTerms.end(), ""),
        config.destructiveTerms.end());
    if (config.destructiveTerms.empty()) {
        throw std::runtime_error("destructive_terms must name at least one word");
    }

    if (config.generationTimeoutMs == 0) {
        throw std::runtime_error("generation_timeout_ms must be greater than zero");
    }

    return config;
}

#ifdef __GNUC__
void SignalHandler(int sig) {
    const int BACKTRACE_LIMIT = 10;
    void *arr[BACKTRACE_LIMIT];
    auto size = backtrace(arr, BACKTRACE_LIMIT);

    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(arr, size, STDERR_FILENO);
    exit(1);
}
#endif
