#include "cli/ScanCli.hpp"

#include <chrono>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QStringList>
#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/driftwatch_version.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "detector/change_detector.hpp"
#include "report/change_records.hpp"

namespace driftwatch {

namespace {

std::string recordText(const nlohmann::json &record, const char *key)
{
    if (!record.contains(key) || record.at(key).is_null()) {
        return "unknown";
    }
    if (record.at(key).is_string()) {
        return record.at(key).get<std::string>();
    }
    return record.at(key).dump();
}

void renderText(const nlohmann::json &records,
                const ChangeSet &changes,
                const DetectorConfig &config)
{
    std::cout << "Driftwatch scan of " << config.monitoredDir.string() << "\n";
    std::cout << "State: " << config.statePath.string() << "\n\n";

    if (changes.empty()) {
        std::cout << "No file changes detected.\n";
        return;
    }

    std::cout << "Found " << changes.total() << " file changes:\n\n";
    for (const auto &record : records) {
        const std::string change = record.value("change", "");
        if (change == "created") {
            std::cout << "NEW FILE CREATED: " << recordText(record, "name") << "\n";
            std::cout << "  path:      " << recordText(record, "path") << "\n";
            std::cout << "  size:      " << recordText(record, "sizeFormatted") << "\n";
            std::cout << "  extension: " << recordText(record, "extension") << "\n";
            std::cout << "  created:   " << recordText(record, "created") << "\n";
            std::cout << "  modified:  " << recordText(record, "modified") << "\n\n";
        } else if (change == "modified") {
            std::cout << "FILE EDITED: " << recordText(record, "name") << "\n";
            std::cout << "  path:      " << recordText(record, "path") << "\n";
            std::cout << "  size:      " << recordText(record, "previousSizeFormatted")
                      << " -> " << recordText(record, "sizeFormatted")
                      << " (" << recordText(record, "sizeChange") << ")\n";
            std::cout << "  modified:  " << recordText(record, "previousModified")
                      << " -> " << recordText(record, "currentModified") << "\n";
            std::cout << "  extension: " << recordText(record, "extension") << "\n\n";
        } else {
            std::cout << "FILE DELETED: " << recordText(record, "name") << "\n";
            std::cout << "  path:          " << recordText(record, "path") << "\n";
            std::cout << "  last size:     " << recordText(record, "lastSize") << "\n";
            std::cout << "  last modified: " << recordText(record, "lastModified") << "\n";
            std::cout << "  extension:     " << recordText(record, "extension") << "\n\n";
        }
    }

    std::cout << "Summary: new " << changes.created.size()
              << ", edited " << changes.modified.size()
              << ", deleted " << changes.deleted.size() << "\n";
}

void renderJson(const nlohmann::json &records,
                const ChangeSet &changes,
                const DetectorConfig &config,
                TimePoint scannedAt,
                long long durationMs)
{
    nlohmann::json payload;
    payload["directory"] = config.monitoredDir.string();
    payload["statePath"] = config.statePath.string();
    payload["scannedAt"] = toIso8601Utc(scannedAt);
    payload["durationMs"] = durationMs;
    payload["summary"] = summarize(changes);
    payload["changes"] = records;

    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace

int ScanCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Detect created, modified and deleted files since the last scan."));
    const QCommandLineOption helpOption(QStringList() << "h" << "help",
                                        QStringLiteral("Show this help."));
    const QCommandLineOption versionOption(QStringList() << "version",
                                           QStringLiteral("Show the version."));
    const QCommandLineOption dirOption(QStringList() << "d" << "dir",
                                       QStringLiteral("Directory to monitor."),
                                       QStringLiteral("path"));
    const QCommandLineOption stateOption(QStringList() << "s" << "state",
                                         QStringLiteral("State file path."),
                                         QStringLiteral("path"));
    const QCommandLineOption backendOption(QStringList() << "backend",
                                           QStringLiteral("State backend: json or sqlite."),
                                           QStringLiteral("name"));
    const QCommandLineOption formatOption(QStringList() << "format",
                                          QStringLiteral("Output format: text or json."),
                                          QStringLiteral("format"),
                                          QStringLiteral("text"));
    const QCommandLineOption levelOption(QStringList() << "log-level",
                                         QStringLiteral("debug, info, warn or error."),
                                         QStringLiteral("level"));
    const QCommandLineOption logFileOption(QStringList() << "log-file",
                                           QStringLiteral("Also append log events to this file."),
                                           QStringLiteral("path"));
    parser.addOption(helpOption);
    parser.addOption(versionOption);
    parser.addOption(dirOption);
    parser.addOption(stateOption);
    parser.addOption(backendOption);
    parser.addOption(formatOption);
    parser.addOption(levelOption);
    parser.addOption(logFileOption);

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n"
                  << parser.helpText().toStdString();
        return kExitUsage;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return kExitOk;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "driftwatch " << DRIFTWATCH_VERSION << std::endl;
        return kExitOk;
    }
    if (!parser.positionalArguments().isEmpty()) {
        std::cerr << "Unexpected argument: "
                  << parser.positionalArguments().first().toStdString() << "\n"
                  << parser.helpText().toStdString();
        return kExitUsage;
    }

    DetectorConfig config;
    try {
        config = loadConfigFromEnvironment();
    } catch (const DriftwatchError &ex) {
        std::cerr << ex.what() << std::endl;
        return kExitUsage;
    }

    if (parser.isSet(dirOption)) {
        config.monitoredDir = absolutePath(parser.value(dirOption).toStdString());
    }
    if (parser.isSet(stateOption)) {
        config.statePath = absolutePath(parser.value(stateOption).toStdString());
    }
    if (parser.isSet(backendOption)
        && !parseStateBackend(parser.value(backendOption), &config.backend)) {
        std::cerr << "Invalid backend. Use json or sqlite." << std::endl;
        return kExitUsage;
    }

    const QString format = parser.value(formatOption).toLower();
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    QString levelValue = qEnvironmentVariable("LOG_LEVEL");
    if (parser.isSet(levelOption)) {
        levelValue = parser.value(levelOption);
    }
    logging::LogLevel level = logging::LogLevel::Info;
    if (!levelValue.isEmpty() && !logging::parseLogLevel(levelValue, &level)) {
        std::cerr << "Invalid log level. Use debug, info, warn or error." << std::endl;
        return kExitUsage;
    }

    QString logFile = qEnvironmentVariable("DRIFTWATCH_LOG_FILE");
    if (parser.isSet(logFileOption)) {
        logFile = parser.value(logFileOption);
    }
    logging::initLogging(QStringLiteral("driftwatch"), level, logFile);

    logging::CorrelationScope scope(logging::generateCorrelationId());
    DWLOG_DEBUG(QStringLiteral("ScanCli"),
                QStringLiteral("run"),
                QStringLiteral("environment"),
                QStringLiteral("user_invocation"),
                (nlohmann::json{{"version", DRIFTWATCH_VERSION},
                                {"workingDirectory", QDir::currentPath().toStdString()},
                                {"monitoredFolder", config.monitoredDir.string()},
                                {"stateFile", config.statePath.string()},
                                {"backend", toBackendString(config.backend).toStdString()},
                                {"logLevel", logging::levelToString(level).toStdString()},
                                {"format", format.toStdString()}}));

    const auto scannedAt = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto started = std::chrono::steady_clock::now();

    ChangeSet changes;
    try {
        ChangeDetector detector(config);
        changes = detector.detectChanges();
    } catch (const DirectoryUnavailable &ex) {
        DWLOG_ERROR(QStringLiteral("ScanCli"),
                    QStringLiteral("run"),
                    QStringLiteral("directory_unavailable"),
                    QStringLiteral("scan_aborted"),
                    (nlohmann::json{{"directory", ex.directory()}, {"error", ex.what()}}));
        std::cerr << ex.what() << std::endl;
        return kExitDirectoryUnavailable;
    } catch (const std::exception &ex) {
        DWLOG_ERROR(QStringLiteral("ScanCli"),
                    QStringLiteral("run"),
                    QStringLiteral("scan_failed"),
                    QStringLiteral("scan_aborted"),
                    (nlohmann::json{{"error", ex.what()}}));
        std::cerr << ex.what() << std::endl;
        return kExitFailure;
    }

    const long long durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();

    logChangeRecords(changes);

    const nlohmann::json records = toChangeRecords(changes);
    if (format == QStringLiteral("json")) {
        renderJson(records, changes, config, scannedAt, durationMs);
    } else {
        renderText(records, changes, config);
    }

    DWLOG_INFO(QStringLiteral("ScanCli"),
               QStringLiteral("run"),
               QStringLiteral("scan_complete"),
               QStringLiteral("user_invocation"),
               (nlohmann::json{{"durationMs", durationMs}, {"summary", summarize(changes)}}));
    return kExitOk;
}

} // namespace driftwatch
