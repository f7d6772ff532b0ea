#include "protocol/CompanionFramer.h"
#include "protocol/CompanionCodes.h"
namespace {
inline uint16_t readU16Le(const QByteArray& b, int i) {
    return static_cast<uint16_t>(static_cast<uint8_t>(b[i])) | static_cast<uint16_t>(static_cast<uint8_t>(b[i + 1]) << 8);
}
inline void appendU16Le(QByteArray& out, uint16_t v) {
    out.append(static_cast<char>(v & 0xFF));
    out.append(static_cast<char>((v >> 8) & 0xFF));
}
}
namespace nf {
CompanionFramer::CompanionFramer(Role role)
    : role_(role),
      tx_marker_(role == Role::Host ? companion::kHostMarker : companion::kDeviceMarker),
      rx_marker_(role == Role::Host ? companion::kDeviceMarker : companion::kHostMarker) {}
int CompanionFramer::feed(QByteArrayView bytes) {
    buffer_.append(bytes.data(), bytes.size());
    int errors = 0;
    while (!buffer_.isEmpty()) {
        const qsizetype sof = buffer_.indexOf(static_cast<char>(rx_marker_));
        if (sof < 0) { skipped_bytes_ += buffer_.size(); buffer_.clear(); break; }
        if (sof > 0) { skipped_bytes_ += sof; buffer_.remove(0, sof); }
        if (buffer_.size() < kHeaderSize) break;

        const uint16_t len = readU16Le(buffer_, 1);
        if (len == 0 || len > companion::kMaxFrameSize) {
            reportError(QStringLiteral("declared length %1 outside 1..%2").arg(len).arg(companion::kMaxFrameSize));
            ++errors;
            buffer_.remove(0, 1);
            continue;
        }
        const int total = kHeaderSize + len;
        if (buffer_.size() < total) break;

        const uint8_t code = static_cast<uint8_t>(buffer_[kHeaderSize]);
        if (!acceptsCode(code)) {
            reportError(QStringLiteral("unknown code 0x%1").arg(int(code), 2, 16, QLatin1Char('0')));
            ++errors;
            buffer_.remove(0, total);
            continue;
        }
        Frame frame;
        frame.code = code;
        frame.payload = buffer_.mid(kHeaderSize + 1, len - 1);
        queue_.enqueue(frame);
        buffer_.remove(0, total);
    }
    return errors;
}
bool CompanionFramer::tryPopFrame(Frame& out) {
    if (queue_.isEmpty()) return false;
    out = queue_.dequeue();
    return true;
}
QByteArray CompanionFramer::buildFrame(uint8_t code, QByteArrayView payload) const {
    QByteArray out;
    out.reserve(kHeaderSize + 1 + static_cast<int>(payload.size()));
    out.append(static_cast<char>(tx_marker_));
    appendU16Le(out, static_cast<uint16_t>(payload.size() + 1));
    out.append(static_cast<char>(code));
    out.append(payload.data(), payload.size());
    return out;
}
void CompanionFramer::reset() { buffer_.clear(); queue_.clear(); frame_error_count_ = 0; last_frame_error_.clear(); skipped_bytes_ = 0; }
bool CompanionFramer::acceptsCode(uint8_t code) const { return role_ == Role::Host ? isKnownResponseCode(code) : isKnownCommandCode(code); }
void CompanionFramer::reportError(const QString& message) { ++frame_error_count_; last_frame_error_ = message; }
}
