#include "app/CliOptions.h"
#include <QtCore/QCommandLineParser>
#include <QtCore/QFileInfo>
namespace {
bool readDouble(const QCommandLineParser& p, const QString& name, double& out, QString& error) {
    bool ok = false;
    const double v = p.value(name).toDouble(&ok);
    if (!ok) { error = QStringLiteral("--%1: '%2' is not a number").arg(name, p.value(name)); return false; }
    out = v;
    return true;
}
bool readInt(const QCommandLineParser& p, const QString& name, int& out, QString& error) {
    bool ok = false;
    const int v = p.value(name).toInt(&ok);
    if (!ok) { error = QStringLiteral("--%1: '%2' is not an integer").arg(name, p.value(name)); return false; }
    out = v;
    return true;
}
qint64 secondsToMs(double s) { return static_cast<qint64>(qRound64(s * 1000.0)); }
constexpr double kMaxTimeoutS = 3600.0;
}
namespace nf {
CliParseOutcome parseCommandLine(const QStringList& arguments, CliOptions& out, const QDateTime& now) {
    QCommandLineParser p;
    p.setApplicationDescription(QStringLiteral("Scan a MeshCore companion radio's noise floor across a frequency range."));
    const QCommandLineOption helpOption = p.addHelpOption();
    const QCommandLineOption versionOption = p.addVersionOption();
    p.addOptions({
        {QStringLiteral("usb"), QStringLiteral("USB serial device (e.g. /dev/ttyUSB0)."), QStringLiteral("device")},
        {QStringLiteral("tcp"), QStringLiteral("TCP target HOST:PORT (e.g. 192.168.1.50:4242)."), QStringLiteral("host:port")},
        {QStringLiteral("baud"), QStringLiteral("Serial baud rate."), QStringLiteral("baud"), QStringLiteral("115200")},
        {QStringLiteral("debug"), QStringLiteral("Print raw protocol frames (hex).")},
        {QStringLiteral("start-mhz"), QStringLiteral("First frequency."), QStringLiteral("mhz"), QStringLiteral("915.0")},
        {QStringLiteral("end-mhz"), QStringLiteral("Last frequency."), QStringLiteral("mhz"), QStringLiteral("928.0")},
        {QStringLiteral("step-mhz"), QStringLiteral("Frequency step."), QStringLiteral("mhz"), QStringLiteral("0.125")},
        {QStringLiteral("dwell-min"), QStringLiteral("Dwell time per frequency in minutes."), QStringLiteral("minutes"), QStringLiteral("15")},
        {QStringLiteral("sample-interval"), QStringLiteral("Seconds between noise floor samples."), QStringLiteral("seconds"), QStringLiteral("5")},
        {QStringLiteral("bw-khz"), QStringLiteral("LoRa bandwidth."), QStringLiteral("khz"), QStringLiteral("250")},
        {QStringLiteral("sf"), QStringLiteral("LoRa spreading factor (5-12)."), QStringLiteral("sf"), QStringLiteral("10")},
        {QStringLiteral("cr"), QStringLiteral("LoRa coding rate (5-8)."), QStringLiteral("cr"), QStringLiteral("5")},
        {QStringLiteral("settle-s"), QStringLiteral("Settle delay after retuning, seconds."), QStringLiteral("seconds"), QStringLiteral("2")},
        {QStringLiteral("timeout-s"), QStringLiteral("Response timeout per attempt, seconds (at most 3600)."), QStringLiteral("seconds"), QStringLiteral("10")},
        {QStringLiteral("retries"), QStringLiteral("Re-sends after a timeout."), QStringLiteral("count"), QStringLiteral("2")},
        {QStringLiteral("out"), QStringLiteral("Output CSV filename (default auto-generated)."), QStringLiteral("file")},
        {QStringLiteral("no-chart"), QStringLiteral("Do not render the PNG chart.")},
        {QStringLiteral("no-restore"), QStringLiteral("Leave the radio on the last scanned frequency.")},
        {QStringLiteral("no-probe"), QStringLiteral("Only send the canonical GET_STATS request.")},
    });
    if (!p.parse(arguments)) return {CliParseResult::Error, p.errorText()};
    if (p.isSet(helpOption)) return {CliParseResult::HelpRequested, p.helpText()};
    if (p.isSet(versionOption)) return {CliParseResult::VersionRequested, QString()};
    if (!p.positionalArguments().isEmpty()) return {CliParseResult::Error, QStringLiteral("unexpected argument '%1'").arg(p.positionalArguments().first())};

    const bool usb = p.isSet(QStringLiteral("usb"));
    const bool tcp = p.isSet(QStringLiteral("tcp"));
    if (usb == tcp) return {CliParseResult::Error, QStringLiteral("exactly one of --usb or --tcp is required")};

    QString error;
    TransportConfig& transport = out.client.transport;
    if (usb) {
        transport.kind = TransportKind::Serial;
        transport.portName = p.value(QStringLiteral("usb"));
        if (!readInt(p, QStringLiteral("baud"), transport.baudRate, error)) return {CliParseResult::Error, error};
    } else {
        const QString target = p.value(QStringLiteral("tcp"));
        const int colon = target.lastIndexOf(QLatin1Char(':'));
        bool ok = false;
        const uint port = colon > 0 ? target.mid(colon + 1).toUInt(&ok) : 0;
        if (!ok || port == 0 || port > 65535) return {CliParseResult::Error, QStringLiteral("--tcp: '%1' is not HOST:PORT").arg(target)};
        transport.kind = TransportKind::Tcp;
        transport.host = target.left(colon);
        transport.port = static_cast<quint16>(port);
    }

    double start = 0, end = 0, step = 0, dwellMin = 0, interval = 0, settle = 0, timeout = 0;
    RadioParams radio;
    int retries = 0;
    if (!readDouble(p, QStringLiteral("start-mhz"), start, error) || !readDouble(p, QStringLiteral("end-mhz"), end, error)
        || !readDouble(p, QStringLiteral("step-mhz"), step, error) || !readDouble(p, QStringLiteral("dwell-min"), dwellMin, error)
        || !readDouble(p, QStringLiteral("sample-interval"), interval, error) || !readDouble(p, QStringLiteral("bw-khz"), radio.bandwidthKhz, error)
        || !readInt(p, QStringLiteral("sf"), radio.spreadingFactor, error) || !readInt(p, QStringLiteral("cr"), radio.codingRate, error)
        || !readDouble(p, QStringLiteral("settle-s"), settle, error) || !readDouble(p, QStringLiteral("timeout-s"), timeout, error)
        || !readInt(p, QStringLiteral("retries"), retries, error)) {
        return {CliParseResult::Error, error};
    }
    if (radio.bandwidthKhz <= 0) return {CliParseResult::Error, QStringLiteral("--bw-khz must be positive")};
    if (radio.spreadingFactor < 5 || radio.spreadingFactor > 12) return {CliParseResult::Error, QStringLiteral("--sf must be between 5 and 12")};
    if (radio.codingRate < 5 || radio.codingRate > 8) return {CliParseResult::Error, QStringLiteral("--cr must be between 5 and 8")};
    if (dwellMin < 0) return {CliParseResult::Error, QStringLiteral("--dwell-min must not be negative")};
    if (interval <= 0) return {CliParseResult::Error, QStringLiteral("--sample-interval must be positive")};
    if (settle < 0) return {CliParseResult::Error, QStringLiteral("--settle-s must not be negative")};
    if (timeout <= 0) return {CliParseResult::Error, QStringLiteral("--timeout-s must be positive")};
    if (timeout > kMaxTimeoutS) return {CliParseResult::Error, QStringLiteral("--timeout-s must not exceed %1").arg(kMaxTimeoutS)};
    if (retries < 0) return {CliParseResult::Error, QStringLiteral("--retries must not be negative")};

    out.client.timeoutMs = static_cast<int>(secondsToMs(timeout));
    out.client.retries = retries;
    out.client.probeStatsShapes = !p.isSet(QStringLiteral("no-probe"));
    out.scan.plan = ScanPlan(start, end, step);
    out.scan.radio = radio;
    out.scan.dwellMs = secondsToMs(dwellMin * 60.0);
    out.scan.sampleIntervalMs = secondsToMs(interval);
    out.scan.settleMs = secondsToMs(settle);
    out.scan.restoreRadio = !p.isSet(QStringLiteral("no-restore"));
    out.debug = p.isSet(QStringLiteral("debug"));
    out.chart = !p.isSet(QStringLiteral("no-chart"));
    out.outPath = p.isSet(QStringLiteral("out")) ? p.value(QStringLiteral("out")) : defaultOutputName(radio, now);
    out.chartPath = chartPathFor(out.outPath);
    return {};
}
QString defaultOutputName(const RadioParams& radio, const QDateTime& now) {
    return QStringLiteral("meshcore-noisefloor-%1-%2-%3_%4.csv")
        .arg(static_cast<int>(radio.bandwidthKhz))
        .arg(radio.spreadingFactor)
        .arg(radio.codingRate)
        .arg(now.toString(QStringLiteral("yyyyMMdd-HHmmss")));
}
QString chartPathFor(const QString& csvPath) {
    const QFileInfo info(csvPath);
    if (info.suffix().compare(QLatin1String("csv"), Qt::CaseInsensitive) == 0) return csvPath.left(csvPath.size() - 3) + QStringLiteral("png");
    return csvPath + QStringLiteral(".png");
}
QStringList chartTitle(const ScanConfig& scan) {
    return {
        QStringLiteral("Meshcore Noise vs Frequency - BW: %1 SF: %2 CR: %3").arg(static_cast<int>(scan.radio.bandwidthKhz)).arg(scan.radio.spreadingFactor).arg(scan.radio.codingRate),
        QStringLiteral("Freq: %1-%2 MHz Steps: %3").arg(scan.plan.startMhz()).arg(scan.plan.endMhz()).arg(scan.plan.stepMhz()),
    };
}
}
