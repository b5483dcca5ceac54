#include "kscope/channel_client.hpp"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonValue>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

#include "kscope/telemetry.hpp"

namespace kscope {

namespace {

std::optional<qint64> jsonInteger(const QJsonValue& value) {
    if (value.isDouble()) {
        return value.toInteger();
    }
    if (value.isString()) {
        bool ok = false;
        const qint64 parsed = value.toString().toLongLong(&ok);
        if (ok) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<qint64> viewerCountOf(const QJsonObject& livestream) {
    if (livestream.contains("viewer_count")) {
        return jsonInteger(livestream.value("viewer_count"));
    }
    return jsonInteger(livestream.value("viewerCount"));
}

QString firstNonEmpty(const QList<QJsonValue>& candidates) {
    for (const QJsonValue& value : candidates) {
        const QString text = value.toString();
        if (!text.isEmpty()) {
            return text;
        }
    }
    return {};
}

}  // namespace

ChannelClient::ChannelClient(const QString& proxyBase, int timeoutMs)
    : proxyBase_(proxyBase),
      timeoutMs_(timeoutMs) {}

QUrl ChannelClient::channelUrl(const QString& channel) {
    return QUrl(QString("https://kick.com/api/v2/channels/%1").arg(channel));
}

QJsonObject ChannelClient::fetch(const QUrl& url, QByteArray* body) {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, "kickscope");
    request.setRawHeader("Accept", "application/json");

    QNetworkReply* reply = network_.get(request);
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(timeoutMs_);
    loop.exec();

    QJsonObject result;
    if (!reply->isFinished()) {
        reply->abort();
        result = {
            {"success", false},
            {"error", "Request timed out."},
        };
    } else if (reply->error() != QNetworkReply::NoError) {
        result = {
            {"success", false},
            {"error", reply->errorString()},
        };
    } else {
        *body = reply->readAll();
        result = {{"success", true}};
    }
    result.insert("url", url.toString());
    reply->deleteLater();
    return result;
}

std::optional<ChannelInfo> ChannelClient::parseChannelDocument(const QByteArray& body) {
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject()) {
        return std::nullopt;
    }
    const QJsonObject root = doc.object();
    const QJsonObject chatroom = root.value("chatroom").toObject();
    const QJsonObject livestream = root.value("livestream").toObject();

    ChannelInfo info;
    info.chatroomId = jsonInteger(chatroom.value("id")).value_or(0);
    info.viewerCount = viewerCountOf(livestream);
    info.streamUrl = firstNonEmpty({
        livestream.value("playback_url"),
        livestream.value("playbackUrl"),
        livestream.value("hls"),
        root.value("playback_url"),
        root.value("playbackUrl"),
    });
    return info;
}

std::optional<qint64> ChannelClient::parseProxyDocument(const QByteArray& body) {
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject()) {
        return std::nullopt;
    }
    return jsonInteger(doc.object().value("chatroomId")).value_or(0);
}

QJsonObject ChannelClient::resolve(const QString& channel, ChannelInfo* out) {
    QByteArray body;
    if (!proxyBase_.isEmpty()) {
        QString base = proxyBase_;
        while (base.endsWith('/')) {
            base.chop(1);
        }
        QUrl url(base + "/channel");
        QUrlQuery query;
        query.addQueryItem("name", channel);
        url.setQuery(query);
        const QJsonObject fetched = fetch(url, &body);
        if (!fetched.value("success").toBool(false)) {
            return fetched;
        }
        const std::optional<qint64> id = parseProxyDocument(body);
        if (!id) {
            return {
                {"success", false},
                {"error", "Proxy response is not a JSON object."},
            };
        }
        out->chatroomId = *id;
        out->viewerCount.reset();
        return {{"success", true}};
    }

    const QJsonObject fetched = fetch(channelUrl(channel), &body);
    if (!fetched.value("success").toBool(false)) {
        return fetched;
    }
    const std::optional<ChannelInfo> info = parseChannelDocument(body);
    if (!info) {
        return {
            {"success", false},
            {"error", "Channel response is not a JSON object."},
        };
    }
    *out = *info;
    return {{"success", true}};
}

std::optional<qint64> ChannelClient::fetchViewerCount(const QString& channel) {
    QByteArray body;
    const QJsonObject fetched = fetch(channelUrl(channel), &body);
    if (!fetched.value("success").toBool(false)) {
        Telemetry::instance().incrementCounter("viewers.refresh_failures");
        Telemetry::instance().recordEvent("viewer_refresh_failed", fetched);
        return std::nullopt;
    }
    const std::optional<ChannelInfo> info = parseChannelDocument(body);
    if (!info) {
        Telemetry::instance().incrementCounter("viewers.refresh_failures");
        return std::nullopt;
    }
    return info->viewerCount;
}

QString ChannelClient::resolveStreamUrl(const QString& channel) {
    QByteArray body;
    const QJsonObject fetched = fetch(channelUrl(channel), &body);
    if (!fetched.value("success").toBool(false)) {
        return {};
    }
    const std::optional<ChannelInfo> info = parseChannelDocument(body);
    return info ? info->streamUrl : QString();
}

}  // namespace kscope
