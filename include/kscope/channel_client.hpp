#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

#include <optional>

namespace kscope {

struct ChannelInfo {
    qint64 chatroomId = 0;
    std::optional<qint64> viewerCount;
    QString streamUrl;
};

// Blocking lookups against the public channel API. The network manager is
// bound to the thread that constructs the client; use it from that thread.
class ChannelClient {
public:
    explicit ChannelClient(const QString& proxyBase = {}, int timeoutMs = 10000);

    QJsonObject resolve(const QString& channel, ChannelInfo* out);
    std::optional<qint64> fetchViewerCount(const QString& channel);
    QString resolveStreamUrl(const QString& channel);

    static std::optional<ChannelInfo> parseChannelDocument(const QByteArray& body);
    // Empty only for a non-object body; an object without an id yields 0.
    static std::optional<qint64> parseProxyDocument(const QByteArray& body);

    static QUrl channelUrl(const QString& channel);

private:
    QJsonObject fetch(const QUrl& url, QByteArray* body);

    QString proxyBase_;
    int timeoutMs_ = 10000;
    QNetworkAccessManager network_;
};

}  // namespace kscope
