#include "common/logging.h"
Q_LOGGING_CATEGORY(lcTransport, "nfscan.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProtocol, "nfscan.protocol", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFrames, "nfscan.frames", QtWarningMsg)
Q_LOGGING_CATEGORY(lcScan, "nfscan.scan", QtInfoMsg)
Q_LOGGING_CATEGORY(lcOutput, "nfscan.output", QtInfoMsg)
namespace nf {
void enableFrameTrace(bool on) { QLoggingCategory::setFilterRules(on ? QStringLiteral("nfscan.frames.debug=true") : QStringLiteral("nfscan.frames.debug=false")); }
}
