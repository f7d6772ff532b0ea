#pragma once
#include "common/types.h"
#include <QtCore/QByteArrayView>
#include <QtCore/QQueue>
namespace nf {
// Envelope: marker, u16 LE length (code + payload), code, payload.
// A host framer sends '<' frames and decodes '>' frames; a device framer the reverse.
class CompanionFramer {
public:
    enum class Role { Host, Device };
    explicit CompanionFramer(Role role = Role::Host);
    // Returns the number of malformed frames dropped while consuming these bytes.
    int feed(QByteArrayView bytes);
    bool tryPopFrame(Frame& out);
    QByteArray buildFrame(uint8_t code, QByteArrayView payload = {}) const;
    void reset();
    Role role() const { return role_; }
    int frameErrorCount() const { return frame_error_count_; }
    QString lastFrameError() const { return last_frame_error_; }
    qint64 skippedBytes() const { return skipped_bytes_; }
    int bufferedBytes() const { return static_cast<int>(buffer_.size()); }
private:
    bool acceptsCode(uint8_t code) const;
    void reportError(const QString& message);
    static constexpr int kHeaderSize = 3;
    Role role_;
    uint8_t tx_marker_;
    uint8_t rx_marker_;
    QByteArray buffer_;
    QQueue<Frame> queue_;
    int frame_error_count_ = 0;
    QString last_frame_error_;
    qint64 skipped_bytes_ = 0;
};
}
