#include "kscope/session_state.hpp"

#include <QMutexLocker>

namespace kscope {

SessionState::SessionState(qint64 startedAtMs, std::optional<qint64> initialViewers)
    : startedAtMs_(startedAtMs),
      viewerCount_(initialViewers),
      lastMessageMs_(startedAtMs) {}

void SessionState::recordMessage(const QString& actor, qint64 atMs) {
    QMutexLocker lock(&mutex_);
    aggregator_.record(actor, atMs);
    lastMessageMs_ = atMs;
}

SessionView SessionState::snapshot(qint64 nowMs) {
    QMutexLocker lock(&mutex_);
    SessionView view;
    view.stats = aggregator_.query(nowMs);
    view.viewerCount = viewerCount_;
    view.latestCapture = latestCapture_;
    view.thumbnailBase64 = thumbnailBase64_;
    view.startedAtMs = startedAtMs_;
    view.lastMessageMs = lastMessageMs_;
    return view;
}

void SessionState::setViewerCount(std::optional<qint64> count) {
    QMutexLocker lock(&mutex_);
    viewerCount_ = count;
}

std::optional<qint64> SessionState::viewerCount() const {
    QMutexLocker lock(&mutex_);
    return viewerCount_;
}

void SessionState::publishCapture(const CaptureReference& capture) {
    QMutexLocker lock(&mutex_);
    latestCapture_ = capture;
    thumbnailBase64_.clear();
}

void SessionState::publishThumbnail(const QString& base64) {
    QMutexLocker lock(&mutex_);
    thumbnailBase64_ = base64;
}

std::optional<CaptureReference> SessionState::latestCapture() const {
    QMutexLocker lock(&mutex_);
    return latestCapture_;
}

QString SessionState::thumbnailBase64() const {
    QMutexLocker lock(&mutex_);
    return thumbnailBase64_;
}

qint64 SessionState::lastMessageMs() const {
    QMutexLocker lock(&mutex_);
    return lastMessageMs_;
}

qint64 SessionState::totalMessages() const {
    QMutexLocker lock(&mutex_);
    return aggregator_.total();
}

}  // namespace kscope
