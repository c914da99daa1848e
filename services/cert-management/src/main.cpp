// =============================================================================
// cert-management - Certificate and Certificate Authority management
// =============================================================================
// Usage:
//   cert-management serve
//   cert-management certificate create <request.json|->
//   cert-management certificate update <id> <request.json|->
//   cert-management certificate delete <id> [--force]
//   cert-management certificate list
//   cert-management certificate host-fingerprint <hostname> <port>
//   cert-management ca create <request.json|->
//   cert-management ca update <id> <request.json|->
//   cert-management ca delete <id>
//   cert-management ca sign-csr <request.json|->
//   cert-management ca list
//   cert-management renew
//   cert-management acme-servers
// =============================================================================

#include "logger.h"
#include "exceptions.h"
#include "infrastructure/app_config.h"
#include "infrastructure/renewal_scheduler.h"
#include "infrastructure/service_container.h"
#include "common/progress_reporter.h"
#include "domain/models/create_request.h"
#include "services/acme_issuance_service.h"
#include "services/bootstrap_certificate.h"
#include "services/certificate_authority_service.h"
#include "services/certificate_service.h"

#include <spdlog/spdlog.h>
#include <json/json.h>
#include <curl/curl.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <pthread.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

using Args = std::vector<std::string>;

// =============================================================================
// JSON I/O
// =============================================================================

Json::Value readJsonArgument(const std::string& source) {
    std::string content;
    if (source == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(source);
        if (!in) {
            throw std::runtime_error("Cannot open request file: " + source);
        }
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream stream(content);
    if (!Json::parseFromStream(builder, stream, &root, &errs)) {
        throw std::runtime_error("Invalid JSON request: " + errs);
    }
    return root;
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

int64_t parseId(const std::string& text) {
    size_t pos = 0;
    long long id = 0;
    try {
        id = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid id: " + text);
    }
    if (pos != text.size()) {
        throw std::runtime_error("Invalid id: " + text);
    }
    return static_cast<int64_t>(id);
}

Json::Value fieldErrorJson(const std::string& field, const std::string& message) {
    Json::Value e;
    e["field"] = field;
    e["message"] = message;
    return e;
}

/// Render a failure for the caller and pick the exit code
int reportError(const std::exception& e) {
    Json::Value out;
    out["success"] = false;
    out["error"] = e.what();

    Json::Value errors(Json::arrayValue);
    if (const auto* v = dynamic_cast<const common::ValidationException*>(&e)) {
        for (const auto& fe : v->errors()) errors.append(fieldErrorJson(fe.field, fe.message));
    } else if (const auto* p = dynamic_cast<const common::PreconditionException*>(&e)) {
        errors.append(fieldErrorJson(p->field(), p->detail()));
    } else if (const auto* p = dynamic_cast<const common::PolicyException*>(&e)) {
        errors.append(fieldErrorJson(p->field(), p->detail()));
    }
    if (!errors.empty()) out["errors"] = errors;

    printJson(out);
    spdlog::error("Command failed: {}", e.what());
    return 1;
}

Json::Value viewsToJson(const std::vector<domain::models::CertificateView>& views) {
    Json::Value out(Json::arrayValue);
    for (const auto& view : views) out.append(view.toJson());
    return out;
}

// =============================================================================
// Commands
// =============================================================================

void requireArgs(const Args& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::runtime_error(std::string("Usage: cert-management ") + usage);
    }
}

int runCertificateCommand(infrastructure::ServiceContainer& container, const Args& args,
                          common::IProgressSink* sink) {
    requireArgs(args, 2, "certificate <create|update|delete|list|host-fingerprint> ...");
    auto* service = container.certificateService();
    const std::string& action = args[1];

    if (action == "create") {
        requireArgs(args, 3, "certificate create <request.json|->");
        auto request = domain::models::parseCertificateCreateRequest(readJsonArgument(args[2]));
        common::ProgressReporter progress("certificate.create", sink);
        printJson(service->create(request, progress).toJson());
    } else if (action == "update") {
        requireArgs(args, 4, "certificate update <id> <request.json|->");
        Json::Value json = readJsonArgument(args[3]);
        std::optional<std::string> name;
        if (json.isMember("name") && json["name"].isString()) name = json["name"].asString();
        common::ProgressReporter progress("certificate.update", sink);
        printJson(service->update(parseId(args[2]), name, progress).toJson());
    } else if (action == "delete") {
        requireArgs(args, 3, "certificate delete <id> [--force]");
        bool force = args.size() > 3 && args[3] == "--force";
        common::ProgressReporter progress("certificate.delete", sink);
        service->remove(parseId(args[2]), force, progress);
        Json::Value out;
        out["success"] = true;
        printJson(out);
    } else if (action == "list") {
        printJson(viewsToJson(service->list()));
    } else if (action == "host-fingerprint") {
        requireArgs(args, 4, "certificate host-fingerprint <hostname> <port>");
        int64_t port = parseId(args[3]);
        if (port < 0 || port > 65535) {
            throw std::runtime_error("Invalid port: " + args[3]);
        }
        auto fingerprint = service->hostCertificateFingerprint(args[2], static_cast<int>(port));
        // Empty when the host cannot be reached
        Json::Value out;
        out["fingerprint"] = fingerprint.value_or("");
        printJson(out);
    } else {
        throw std::runtime_error("Unknown certificate command: " + action);
    }
    return 0;
}

int runCaCommand(infrastructure::ServiceContainer& container, const Args& args,
                 common::IProgressSink* sink) {
    requireArgs(args, 2, "ca <create|update|delete|sign-csr|list> ...");
    auto* service = container.certificateAuthorityService();
    const std::string& action = args[1];

    if (action == "create") {
        requireArgs(args, 3, "ca create <request.json|->");
        auto request = domain::models::parseCaCreateRequest(readJsonArgument(args[2]));
        printJson(service->create(request).toJson());
    } else if (action == "update") {
        requireArgs(args, 4, "ca update <id> <request.json|->");
        auto request = domain::models::parseCaUpdateRequest(readJsonArgument(args[3]));
        common::ProgressReporter progress("certificate_authority.update", sink);
        printJson(service->update(parseId(args[2]), request, progress).toJson());
    } else if (action == "delete") {
        requireArgs(args, 3, "ca delete <id>");
        service->remove(parseId(args[2]));
        Json::Value out;
        out["success"] = true;
        printJson(out);
    } else if (action == "sign-csr") {
        requireArgs(args, 3, "ca sign-csr <request.json|->");
        auto request = domain::models::parseCaSignCsrRequest(readJsonArgument(args[2]));
        common::ProgressReporter progress("certificate_authority.ca_sign_csr", sink);
        printJson(service->signCsr(request, progress).toJson());
    } else if (action == "list") {
        printJson(viewsToJson(service->list()));
    } else {
        throw std::runtime_error("Unknown ca command: " + action);
    }
    return 0;
}

Json::Value renewalReportJson(const services::RenewalReport& report) {
    Json::Value out;
    out["checked"] = static_cast<Json::UInt64>(report.checked);
    out["renewed"] = Json::Value(Json::arrayValue);
    for (const auto& name : report.renewed) out["renewed"].append(name);
    out["failed"] = Json::Value(Json::arrayValue);
    for (const auto& name : report.failed) out["failed"].append(name);
    return out;
}

int runServe(infrastructure::ServiceContainer& container, const AppConfig& config,
             common::IProgressSink* sink) {
    // Block termination signals before any thread starts so sigwait receives them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    container.bootstrapCertificate()->ensure();

    infrastructure::RenewalScheduler scheduler;
    if (config.renewalEnabled) {
        scheduler.configure(std::chrono::seconds(config.renewalStartupDelaySec),
                            std::chrono::hours(config.renewalIntervalHours));
        scheduler.setRenewFn([&container, sink]() {
            common::ProgressReporter progress("acme.renew", sink);
            auto report = container.acmeIssuanceService()->renewCertificates(progress);
            spdlog::info("Renewal sweep: checked={}, renewed={}, failed={}",
                         report.checked, report.renewed.size(), report.failed.size());
        });
        scheduler.start();
    } else {
        spdlog::info("Renewal scheduler disabled");
    }

    spdlog::info("cert-management running, waiting for SIGINT/SIGTERM");
    int received = 0;
    sigwait(&signals, &received);
    spdlog::info("Received signal {}, shutting down", received);

    scheduler.stop();
    return 0;
}

int dispatch(infrastructure::ServiceContainer& container, const AppConfig& config, const Args& args) {
    common::LoggingProgressSink sink;
    const std::string& command = args[0];

    if (command == "serve") return runServe(container, config, &sink);
    if (command == "certificate") return runCertificateCommand(container, args, &sink);
    if (command == "ca") return runCaCommand(container, args, &sink);
    if (command == "renew") {
        common::ProgressReporter progress("acme.renew", &sink);
        printJson(renewalReportJson(container.acmeIssuanceService()->renewCertificates(progress)));
        return 0;
    }
    throw std::runtime_error("Unknown command: " + command);
}

void printUsage() {
    std::cerr << "Usage: cert-management <serve|certificate|ca|renew|acme-servers> ...\n"
              << "  certificate create|update|delete|list|host-fingerprint\n"
              << "  ca create|update|delete|sign-csr|list\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args(argv + 1, argv + argc);
    if (args.empty()) {
        printUsage();
        return 2;
    }

    AppConfig config = AppConfig::fromEnvironment();
    common::Logger::initialize("cert-management", config.logLevel, !config.logFile.empty(), config.logFile);

    // Needs no database
    if (args[0] == "acme-servers") {
        Json::Value out;
        for (const auto& [uri, label] : services::CertificateService::acmeServerChoices()) {
            out[uri] = label;
        }
        printJson(out);
        return 0;
    }

    try {
        config.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    // Initialize CURL library (must be done before any threads)
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc = 0;
    {
        infrastructure::ServiceContainer container;
        if (!container.initialize(config)) {
            curl_global_cleanup();
            return 1;
        }

        try {
            rc = dispatch(container, config, args);
        } catch (const std::exception& e) {
            rc = reportError(e);
        }
    }

    curl_global_cleanup();
    common::Logger::flush();
    return rc;
}
