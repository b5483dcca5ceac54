#pragma once

#include <QMutex>
#include <QString>

#include <optional>

#include "kscope/window_aggregator.hpp"

namespace kscope {

struct CaptureReference {
    QString path;
    qint64 createdAtMs = 0;
};

// Consistent copy of everything a snapshot needs, taken under one lock.
struct SessionView {
    WindowStats stats;
    std::optional<qint64> viewerCount;
    std::optional<CaptureReference> latestCapture;
    QString thumbnailBase64;
    qint64 startedAtMs = 0;
    qint64 lastMessageMs = 0;
};

// The only state shared between the feed, the scheduler, the viewer poller
// and the capture worker. Every accessor takes the same mutex so counts,
// uniqueness and capture references always change together.
class SessionState {
public:
    explicit SessionState(qint64 startedAtMs, std::optional<qint64> initialViewers = std::nullopt);

    void recordMessage(const QString& actor, qint64 atMs);
    SessionView snapshot(qint64 nowMs);

    void setViewerCount(std::optional<qint64> count);
    [[nodiscard]] std::optional<qint64> viewerCount() const;

    void publishCapture(const CaptureReference& capture);
    void publishThumbnail(const QString& base64);
    [[nodiscard]] std::optional<CaptureReference> latestCapture() const;
    [[nodiscard]] QString thumbnailBase64() const;

    [[nodiscard]] qint64 startedAtMs() const { return startedAtMs_; }
    [[nodiscard]] qint64 lastMessageMs() const;
    [[nodiscard]] qint64 totalMessages() const;

private:
    mutable QMutex mutex_;
    const qint64 startedAtMs_;
    WindowAggregator aggregator_;
    std::optional<qint64> viewerCount_;
    std::optional<CaptureReference> latestCapture_;
    QString thumbnailBase64_;
    qint64 lastMessageMs_;
};

}  // namespace kscope
