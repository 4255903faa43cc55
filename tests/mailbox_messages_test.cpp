#include "wormhole/mailbox_messages.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "wormhole/errors.hpp"

TEST(MailboxMessagesTest, AddFrameCarriesHexBody) {
    Wormhole::MailboxFrame frame = Wormhole::MailboxFrame::add("pake", {0xde, 0xad, 0xbe, 0xef});

    nlohmann::json wire = nlohmann::json::parse(frame.serialize());
    ASSERT_EQ(wire, nlohmann::json::parse(R"({"type": "add", "phase": "pake", "body": "deadbeef"})"));

    Wormhole::MailboxFrame parsed = Wormhole::MailboxFrame::deserialize(frame.serialize());
    ASSERT_EQ(parsed.type, "add");
    ASSERT_EQ(parsed.phase, "pake");
    ASSERT_EQ(parsed.body, (Wormhole::byte_vector{0xde, 0xad, 0xbe, 0xef}));
}

TEST(MailboxMessagesTest, BindAndClaim) {
    nlohmann::json bind = nlohmann::json::parse(Wormhole::MailboxFrame::bind("lothar.com/x", "a1b2c3").serialize());
    ASSERT_EQ(bind, nlohmann::json::parse(R"({"type": "bind", "appid": "lothar.com/x", "side": "a1b2c3"})"));

    nlohmann::json claim = nlohmann::json::parse(Wormhole::MailboxFrame::claim("7").serialize());
    ASSERT_EQ(claim, nlohmann::json::parse(R"({"type": "claim", "nameplate": "7"})"));
}

TEST(MailboxMessagesTest, ServerFrames) {
    Wormhole::MailboxFrame error = Wormhole::MailboxFrame::deserialize(R"({"type": "error", "error": "crowded"})");
    ASSERT_EQ(error.type, "error");
    ASSERT_EQ(error.error, "crowded");

    Wormhole::MailboxFrame message =
        Wormhole::MailboxFrame::deserialize(R"({"type": "message", "side": "ff00", "phase": "0", "body": "00"})");
    ASSERT_EQ(message.side, "ff00");
    ASSERT_EQ(message.phase, "0");
    ASSERT_EQ(message.body, (Wormhole::byte_vector{0x00}));
}

TEST(MailboxMessagesTest, DeserializeRejectsBadFrames) {
    ASSERT_THROW(Wormhole::MailboxFrame::deserialize("not json"), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::MailboxFrame::deserialize("[]"), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::MailboxFrame::deserialize(R"({"phase": "0"})"), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::MailboxFrame::deserialize(R"({"type": 3})"), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::MailboxFrame::deserialize(R"({"type": "add", "body": "xyz"})"), Wormhole::MalformedMessage);
}
