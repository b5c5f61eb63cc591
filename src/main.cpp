/**
 * Valstore - Reauthentication and storefront retrieval for Valorant
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <fstream>
#include <sstream>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "core/config/ConfigManager.hpp"
#include "core/credentials/CredentialStore.hpp"
#include "core/credentials/LegacyFileStore.hpp"
#include "core/platform/Platform.hpp"
#include "network/HttpTransport.hpp"
#include "store/StoreService.hpp"

namespace {

void setupLogging(const std::filesystem::path& configPath, bool verbose) {
    // stdout carries command output, logs go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    auto logPath = configPath / "logs" / "valstore.log";

    // Ensure log directory exists
    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), 1024 * 1024 * 5, 3);
    file_sink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>(
        "valstore", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("Valstore starting up...");
}

int runStore(valstore::StoreService& service, const std::string& userId) {
    QTextStream out(stdout);
    auto result = service.fetchStoreItems(userId);

    if (!result.isSuccess()) {
        QTextStream err(stderr);
        err << valstore::storeErrorName(result.error) << ": " << result.errorMessage << "\n";
        err << result.hint << "\n";
        return 1;
    }

    for (const auto& item : result.items) {
        QString price = item.price ? QString::number(*item.price) : QString("?");
        out << "- " << item.name << ": " << price << " VP\n";
    }
    return 0;
}

int runImport(valstore::CredentialStore* primary, const std::string& userId,
              const QString& file) {
    QTextStream err(stderr);
    if (!primary || !primary->isAvailable()) {
        err << "No primary credential store is available\n";
        return 1;
    }

    std::ifstream input(file.toStdString());
    if (!input) {
        err << "Cannot read " << file << "\n";
        return 1;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto bundle = valstore::LegacyFileStore::parse(buffer.str());
    if (!bundle.isValid()) {
        err << valstore::hintFor(valstore::StoreError::InvalidCredentials) << "\n";
        return 1;
    }

    if (!primary->store(userId, bundle)) {
        err << "Failed to save credentials to " << QString::fromStdString(primary->displayName()) << "\n";
        return 1;
    }

    QTextStream(stdout) << "Imported credentials for " << QString::fromStdString(userId) << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("valstore");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("valstore");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Valorant storefront retrieval");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption languageOption(
        QStringList() << "l" << "language",
        "Skin name language, e.g. ja-JP or en-US",
        "tag"
    );
    parser.addOption(languageOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Log debug output to stderr"
    );
    parser.addOption(verboseOption);

    parser.addPositionalArgument("command", "store, diag or import");
    parser.addPositionalArgument("user", "User id");
    parser.addPositionalArgument("file", "Cookie file (import only)", "[file]");

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        parser.showHelp(1);
    }
    const QString command = args.at(0);
    const std::string userId = args.at(1).toStdString();

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = valstore::Platform::getConfigPath();
    }

    setupLogging(configPath, parser.isSet(verboseOption));

    auto& configManager = valstore::ConfigManager::instance();
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }

    spdlog::info("Configuration loaded from: {}", configPath.string());

    valstore::EngineConfig config = configManager.engineConfig();
    if (parser.isSet(languageOption)) {
        config.language = parser.value(languageOption).toStdString();
    }
    if (!parser.isSet(verboseOption)) {
        spdlog::level::level_enum level = spdlog::level::from_str(config.logVerbosity);
        spdlog::default_logger()->sinks().front()->set_level(level);
    }

    auto primary = valstore::CredentialStore::createPrimary(config);
    auto legacy = valstore::CredentialStore::createLegacy(config);

    if (command == "import") {
        if (args.size() < 3) {
            parser.showHelp(1);
        }
        return runImport(primary.get(), userId, args.at(2));
    }

    valstore::StoreService service(config, primary.get(), legacy.get(),
                                   valstore::QtHttpTransport::factory());

    if (command == "store") {
        return runStore(service, userId);
    }
    if (command == "diag") {
        QTextStream(stdout) << service.runDiagnostics(userId) << "\n";
        return 0;
    }

    spdlog::error("Unknown command: {}", command.toStdString());
    parser.showHelp(1);
}
