#include "test_support.hpp"

#include "kscope/chat_feed.hpp"

using kscope::ChatFeed;
using kscope::ChatMessage;

namespace {

QString chatFrame(const QString& data) {
    const QJsonObject frame{
        {"event", "App\\Events\\ChatMessageEvent"},
        {"channel", "chatrooms.42.v2"},
        {"data", data},
    };
    return QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact));
}

}  // namespace

TEST_CASE("Chat events are decoded from nested JSON text", "[feed]") {
    const std::optional<ChatMessage> message =
        ChatFeed::parseFrame(chatFrame(R"({"content":"gg","sender":{"username":"kim","id":7}})"));
    REQUIRE(message.has_value());
    REQUIRE(message->username == "kim");
    REQUIRE(message->content == "gg");
}

TEST_CASE("Missing sender and content fall back to defaults", "[feed]") {
    SECTION("no sender") {
        const auto message = ChatFeed::parseFrame(chatFrame(R"({"content":"hi"})"));
        REQUIRE(message.has_value());
        REQUIRE(message->username == "anon");
        REQUIRE(message->content == "hi");
    }
    SECTION("empty username and no content") {
        const auto message = ChatFeed::parseFrame(chatFrame(R"({"sender":{"username":""}})"));
        REQUIRE(message.has_value());
        REQUIRE(message->username == "anon");
        REQUIRE(message->content.isEmpty());
    }
    SECTION("empty data") {
        const auto message = ChatFeed::parseFrame(chatFrame(""));
        REQUIRE(message.has_value());
        REQUIRE(message->username == "anon");
    }
}

TEST_CASE("Frames that are not chat messages are dropped", "[feed]") {
    REQUIRE_FALSE(ChatFeed::parseFrame("not json").has_value());
    REQUIRE_FALSE(ChatFeed::parseFrame("[1,2,3]").has_value());
    REQUIRE_FALSE(ChatFeed::parseFrame(R"({"event":"pusher:ping","data":{}})").has_value());
    REQUIRE_FALSE(ChatFeed::parseFrame(
        R"({"event":"App\\Events\\UserBannedEvent","data":"{}"})").has_value());
    REQUIRE_FALSE(ChatFeed::parseFrame(chatFrame("{broken")).has_value());
}

TEST_CASE("Subscribe frame names the chatroom channel", "[feed]") {
    const QJsonObject frame =
        QJsonDocument::fromJson(ChatFeed::subscribeFrame(668).toUtf8()).object();
    REQUIRE(frame.value("event").toString() == "pusher:subscribe");
    const QJsonObject data = frame.value("data").toObject();
    REQUIRE(data.value("channel").toString() == "chatrooms.668.v2");
    REQUIRE(data.value("auth").toString().isEmpty());
}

TEST_CASE("Default endpoint speaks Pusher protocol 7", "[feed]") {
    ChatFeed feed(1);
    REQUIRE(feed.url().startsWith("wss://ws-us2.pusher.com/app/"));
    REQUIRE(feed.url().contains("protocol=7"));
    REQUIRE_FALSE(feed.isConnected());
}
