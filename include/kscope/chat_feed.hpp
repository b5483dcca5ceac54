#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <QWebSocket>

#include <optional>

namespace kscope {

struct ChatMessage {
    QString username;
    QString content;
};

// Pusher protocol client for one chatroom. Emits messageReceived for every
// chat event; everything else, including malformed frames, is dropped.
// Reconnects on its own until stop() is called.
class ChatFeed final : public QObject {
    Q_OBJECT

public:
    static constexpr int kReconnectDelayMs = 2000;

    explicit ChatFeed(qint64 chatroomId, const QString& url = {}, QObject* parent = nullptr);
    ~ChatFeed() override;

    void start();
    void stop();

    [[nodiscard]] bool isConnected() const { return connected_; }
    [[nodiscard]] QString url() const { return url_; }

    static QString defaultUrl();
    static QString subscribeFrame(qint64 chatroomId);
    static std::optional<ChatMessage> parseFrame(const QString& frame);

signals:
    void messageReceived(const QString& username, const QString& content);

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessage(const QString& frame);

private:
    void open();

    qint64 chatroomId_ = 0;
    QString url_;
    QWebSocket socket_;
    QTimer reconnectTimer_;
    bool connected_ = false;
    bool stopping_ = false;
};

}  // namespace kscope
