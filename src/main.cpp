#include <csignal>
#include <execinfo.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "../include/Logger.h"
#include "audit/AuditJson.h"
#include "audit/AuditPipeline.h"
#include "config/ConfigLoader.h"
#include "crawler/CurlHttpTransport.h"

using namespace seo_audit;

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        char** messages = backtrace_symbols(array, size);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        if (messages) {
            for (int i = 0; i < size; ++i) {
                std::cerr << messages[i] << "\n";
            }
        }
        std::cerr.flush();
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

struct CommandLine {
    std::string rootUrl;
    std::string configPath;
    std::string outputPath;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <root-url> [--config <file.json>] [--output <file.json>]\n"
              << "\n"
              << "Environment:\n"
              << "  LOG_LEVEL              TRACE, DEBUG, INFO, WARNING, ERROR or NONE\n"
              << "  LOG_FILE               append log lines to this file\n"
              << "  SEO_AUDIT_MAX_PAGES    page budget\n"
              << "  SEO_AUDIT_MAX_DEPTH    maximum link depth from the seeds\n"
              << "  SEO_AUDIT_CONCURRENCY  concurrent fetches\n"
              << "  SEO_AUDIT_TIMEOUT_MS   first-attempt request timeout\n"
              << "  SEO_AUDIT_BUDGET_MS    wall-clock budget for the whole run\n"
              << "  SEO_AUDIT_DELAY_MS     minimum delay between requests to one host\n"
              << "  SEO_AUDIT_USER_AGENT   user agent sent with every request\n";
}

// Throws std::invalid_argument on unusable arguments
CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--output") {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a file path");
            }
            (arg == "--config" ? cmd.configPath : cmd.outputPath) = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cmd.rootUrl.empty()) {
            cmd.rootUrl = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    if (cmd.rootUrl.empty()) {
        throw std::invalid_argument("A root URL is required");
    }
    return cmd;
}

int main(int argc, char* argv[]) {
    installCrashHandler();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    Logger::getInstance().initFromEnvironment(LogLevel::INFO);

    CommandLine cmd;
    crawler::AuditConfig auditConfig;
    try {
        cmd = parseArguments(argc, argv);
        // The JSON document owns stdout unless it goes to a file
        Logger::getInstance().setUseStderr(cmd.outputPath.empty());

        if (!cmd.configPath.empty()) {
            auditConfig = config::ConfigLoader::fromFile(cmd.configPath);
        }
        config::ConfigLoader::applyEnvironment(auditConfig);
        config::ConfigLoader::validate(auditConfig);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    LOG_DEBUG("Effective configuration: " + config::ConfigLoader::toJson(auditConfig).dump());

    audit::AuditResult result;
    try {
        auto transport = std::make_shared<crawler::CurlHttpTransport>();
        audit::AuditPipeline pipeline(auditConfig, transport);
        result = pipeline.run(cmd.rootUrl);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(std::string("Invalid input: ") + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const std::string document = audit::toJson(result).dump(2);
    if (cmd.outputPath.empty()) {
        std::cout << document << std::endl;
    } else {
        std::ofstream out(cmd.outputPath);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write audit result to " + cmd.outputPath);
            return 1;
        }
        out << document << std::endl;
        LOG_INFO("Audit result written to " + cmd.outputPath);
    }

    return 0;
}
