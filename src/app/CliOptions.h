#pragma once
#include "core/CompanionClient.h"
#include "core/ScanController.h"
#include <QtCore/QDateTime>
#include <QtCore/QStringList>
namespace nf {
struct CliOptions {
    ClientConfig client;
    ScanConfig scan;
    QString outPath;
    QString chartPath;
    bool chart = true;
    bool debug = false;
};
enum class CliParseResult { Ok, Error, HelpRequested, VersionRequested };
struct CliParseOutcome {
    CliParseResult result = CliParseResult::Ok;
    QString message;
};
CliParseOutcome parseCommandLine(const QStringList& arguments, CliOptions& out, const QDateTime& now = QDateTime::currentDateTime());
QString defaultOutputName(const RadioParams& radio, const QDateTime& now);
QString chartPathFor(const QString& csvPath);
QStringList chartTitle(const ScanConfig& scan);
}
