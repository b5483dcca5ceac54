#include "kscope/viewer_poller.hpp"

#include "kscope/channel_client.hpp"
#include "kscope/telemetry.hpp"

namespace kscope {

ViewerPoller::ViewerPoller(
    SessionState* state,
    const QString& channel,
    Fetcher fetcher,
    int intervalMs,
    QObject* parent)
    : QObject(parent),
      state_(state),
      channel_(channel),
      fetcher_(std::move(fetcher)),
      intervalMs_(intervalMs) {}

ViewerPoller::~ViewerPoller() = default;

void ViewerPoller::start() {
    if (!fetcher_) {
        // Created here so the network manager belongs to the polling thread.
        client_ = std::make_unique<ChannelClient>();
        fetcher_ = [this]() { return client_->fetchViewerCount(channel_); };
    }
    if (timer_ == nullptr) {
        timer_ = new QTimer(this);
        timer_->setInterval(intervalMs_);
        connect(timer_, &QTimer::timeout, this, &ViewerPoller::refresh);
    }
    refresh();
    timer_->start();
}

void ViewerPoller::stop() {
    if (timer_ != nullptr) {
        timer_->stop();
    }
}

void ViewerPoller::refresh() {
    if (!fetcher_) {
        return;
    }
    const std::optional<qint64> count = fetcher_();
    state_->setViewerCount(count);
    if (count) {
        Telemetry::instance().setGauge("viewers.last_count", static_cast<double>(*count));
    }
    refreshCount_++;
}

}  // namespace kscope
