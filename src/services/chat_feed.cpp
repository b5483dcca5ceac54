#include "kscope/chat_feed.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

#include "kscope/telemetry.hpp"

namespace kscope {

namespace {

const QString kChatEvent = QStringLiteral("App\\Events\\ChatMessageEvent");

std::optional<QJsonObject> parseObject(const QByteArray& text) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(text, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

}  // namespace

ChatFeed::ChatFeed(qint64 chatroomId, const QString& url, QObject* parent)
    : QObject(parent),
      chatroomId_(chatroomId),
      url_(url.isEmpty() ? defaultUrl() : url) {
    reconnectTimer_.setSingleShot(true);
    reconnectTimer_.setInterval(kReconnectDelayMs);
    connect(&reconnectTimer_, &QTimer::timeout, this, &ChatFeed::open);
    connect(&socket_, &QWebSocket::connected, this, &ChatFeed::onConnected);
    connect(&socket_, &QWebSocket::disconnected, this, &ChatFeed::onDisconnected);
    connect(&socket_, &QWebSocket::textMessageReceived, this, &ChatFeed::onTextMessage);
}

ChatFeed::~ChatFeed() {
    stop();
}

QString ChatFeed::defaultUrl() {
    return "wss://ws-us2.pusher.com/app/32cbd69e4b950bf97679"
           "?protocol=7&client=kickscope&version=1.0&flash=false";
}

QString ChatFeed::subscribeFrame(qint64 chatroomId) {
    const QJsonObject frame{
        {"event", "pusher:subscribe"},
        {"data", QJsonObject{
            {"auth", ""},
            {"channel", QString("chatrooms.%1.v2").arg(chatroomId)},
        }},
    };
    return QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact));
}

std::optional<ChatMessage> ChatFeed::parseFrame(const QString& frame) {
    const std::optional<QJsonObject> payload = parseObject(frame.toUtf8());
    if (!payload || payload->value("event").toString() != kChatEvent) {
        return std::nullopt;
    }

    // The event body arrives as JSON text nested inside the frame.
    const QJsonValue dataValue = payload->value("data");
    std::optional<QJsonObject> data;
    if (dataValue.isString()) {
        const QString text = dataValue.toString();
        data = text.isEmpty() ? std::optional<QJsonObject>(QJsonObject()) : parseObject(text.toUtf8());
    } else if (dataValue.isObject()) {
        data = dataValue.toObject();
    } else if (dataValue.isUndefined() || dataValue.isNull()) {
        data = QJsonObject();
    }
    if (!data) {
        return std::nullopt;
    }

    ChatMessage message;
    message.username = data->value("sender").toObject().value("username").toString();
    if (message.username.isEmpty()) {
        message.username = "anon";
    }
    message.content = data->value("content").toString();
    return message;
}

void ChatFeed::start() {
    stopping_ = false;
    open();
}

void ChatFeed::stop() {
    stopping_ = true;
    reconnectTimer_.stop();
    if (socket_.state() != QAbstractSocket::UnconnectedState) {
        socket_.abort();
    }
    connected_ = false;
}

void ChatFeed::open() {
    if (stopping_) {
        return;
    }
    socket_.open(QUrl(url_));
}

void ChatFeed::onConnected() {
    connected_ = true;
    socket_.sendTextMessage(subscribeFrame(chatroomId_));
    Telemetry::instance().recordEvent("feed_connected", {{"chatroom_id", static_cast<double>(chatroomId_)}});
}

void ChatFeed::onDisconnected() {
    const bool wasConnected = connected_;
    connected_ = false;
    if (wasConnected) {
        Telemetry::instance().recordEvent("feed_disconnected", {{"reason", socket_.closeReason()}});
    }
    if (!stopping_) {
        reconnectTimer_.start();
    }
}

void ChatFeed::onTextMessage(const QString& frame) {
    Telemetry::instance().incrementCounter("feed.frames");

    const std::optional<QJsonObject> payload = parseObject(frame.toUtf8());
    if (!payload) {
        Telemetry::instance().incrementCounter("feed.malformed_frames");
        return;
    }
    const QString event = payload->value("event").toString();
    if (event == "pusher:ping") {
        socket_.sendTextMessage(R"({"event":"pusher:pong","data":{}})");
        return;
    }
    if (event != kChatEvent) {
        return;
    }

    const std::optional<ChatMessage> message = parseFrame(frame);
    if (!message) {
        Telemetry::instance().incrementCounter("feed.malformed_frames");
        return;
    }
    Telemetry::instance().incrementCounter("feed.messages");
    emit messageReceived(message->username, message->content);
}

}  // namespace kscope
