#include "app/CliOptions.h"
#include "common/Clock.h"
#include "common/logging.h"
#include "core/CompanionClient.h"
#include "core/CsvRecordSink.h"
#include "core/ScanController.h"
#include "render/PngChartRenderer.h"
#include "transport/TransportFactory.h"
#include <QtCore/QTextStream>
#include <QtGui/QGuiApplication>
#include <atomic>
#include <csignal>
namespace {
std::atomic<nf::ScanController*> g_scan{nullptr};
static_assert(std::atomic<nf::ScanController*>::is_always_lock_free, "stop signal handler needs a lock-free pointer");
void onStopSignal(int) {
    if (nf::ScanController* scan = g_scan.load()) scan->requestStop();
}
}
int main(int argc, char* argv[]) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    qSetMessagePattern(QStringLiteral("%{if-warning}[!] %{endif}%{if-critical}[x] %{endif}%{if-debug}[%{category}] %{endif}%{message}"));
    QCoreApplication::setApplicationName(QStringLiteral("nfscan"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    QTextStream out(stdout);
    QTextStream err(stderr);

    nf::CliOptions options;
    const nf::CliParseOutcome parsed = nf::parseCommandLine(QCoreApplication::arguments(), options);
    switch (parsed.result) {
    case nf::CliParseResult::HelpRequested: out << parsed.message; return 0;
    case nf::CliParseResult::VersionRequested: out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << Qt::endl; return 0;
    case nf::CliParseResult::Error: err << "nfscan: " << parsed.message << Qt::endl; return 2;
    case nf::CliParseResult::Ok: break;
    }
    nf::enableFrameTrace(options.debug);

    const nf::ScanPlan& plan = options.scan.plan;
    const nf::RadioParams& radio = options.scan.radio;
    out << "Output CSV : " << options.outPath << Qt::endl;
    out << "Freq range : " << plan.startMhz() << " -> " << plan.endMhz() << " MHz (step " << plan.stepMhz() << " MHz) | total " << plan.size() << Qt::endl;
    out << "Radio      : BW " << radio.bandwidthKhz << " kHz | SF " << radio.spreadingFactor << " | CR " << radio.codingRate << Qt::endl << Qt::endl;
    if (plan.isEmpty()) qCWarning(lcScan) << "frequency plan is empty (check start/end/step), nothing to measure";

    nf::CsvRecordSink csv(options.outPath);
    nf::PngChartRenderer chart(options.chartPath, nf::chartTitle(options.scan));

    nf::CompanionClient client(nf::createTransport(options.client.transport.kind), options.client);
    QObject::connect(&client, &nf::CompanionClient::pushReceived, [](const nf::Frame& frame) {
        qCDebug(lcProtocol) << "push notification" << Qt::hex << int(frame.code) << "ignored";
    });
    nf::SteadyClock clock;
    nf::ScanController scan(&client, &clock, options.scan);
    scan.setRecordSink(&csv);
    if (options.chart) scan.setChartRenderer(&chart);
    QObject::connect(&scan, &nf::ScanController::progress, [&out](int index, int total, double freq) {
        out << '[' << index << '/' << total << "] Measuring " << QString::number(freq, 'g', 10) << " MHz" << Qt::endl;
    });
    QObject::connect(&scan, &nf::ScanController::recordReady, [&out](const nf::FrequencyRecord& r) {
        if (r.samples > 0) out << "    avg=" << QString::number(r.average, 'f', 2) << " (" << r.samples << " samples)" << Qt::endl;
        else out << "    no samples" << Qt::endl;
    });

    g_scan.store(&scan);
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    const nf::ScanResult result = scan.run();
    g_scan.store(nullptr);
    const bool csvCreated = csv.isOpen();
    csv.close();

    if (result.error.kind == nf::ErrorKind::Output) {
        err << "nfscan: cannot create " << options.outPath << ": " << csv.errorString() << Qt::endl;
        return 1;
    }
    if (!result.ok()) {
        err << "nfscan: scan failed during " << nf::scanStateName(result.failedIn) << ": " << result.error.message << Qt::endl;
        if (csvCreated) err << "nfscan: " << result.records.size() << " record(s) kept in " << options.outPath << Qt::endl;
        else err << "nfscan: " << options.outPath << " left untouched" << Qt::endl;
        return 1;
    }
    out << Qt::endl << (result.stopped ? "Scan stopped." : "Scan complete.") << Qt::endl;
    out << "Records saved to    : " << options.outPath << Qt::endl;
    if (chart.rendered()) out << "Chart saved to      : " << options.chartPath << Qt::endl;
    return 0;
}
