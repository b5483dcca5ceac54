#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <memory>
#include <optional>

#include "kscope/session_state.hpp"

namespace kscope {

class ChannelClient;

// Refreshes the viewer count on a fixed interval. Meant to live on its own
// QThread; every refresh is a blocking request. Any failure publishes an
// unknown count rather than keeping a stale one.
class ViewerPoller final : public QObject {
    Q_OBJECT

public:
    using Fetcher = std::function<std::optional<qint64>()>;

    static constexpr int kIntervalMs = 20000;

    ViewerPoller(
        SessionState* state,
        const QString& channel,
        Fetcher fetcher = {},
        int intervalMs = kIntervalMs,
        QObject* parent = nullptr);
    ~ViewerPoller() override;

    [[nodiscard]] int refreshCount() const { return refreshCount_; }

public slots:
    void start();
    void stop();
    void refresh();

private:
    SessionState* state_ = nullptr;
    QString channel_;
    Fetcher fetcher_;
    int intervalMs_ = kIntervalMs;
    QTimer* timer_ = nullptr;
    std::unique_ptr<ChannelClient> client_;
    int refreshCount_ = 0;
};

}  // namespace kscope
