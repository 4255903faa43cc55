#include "wormhole/control_message.hpp"

#include <gtest/gtest.h>

#include <string>

#include "wormhole/errors.hpp"

namespace {

Wormhole::byte_vector bytes(const std::string& text) {
    return Wormhole::byte_vector(text.begin(), text.end());
}

}  // namespace

TEST(ControlMessageTest, TransitRoundTrip) {
    Wormhole::TransitInfo info;
    info.abilities = nlohmann::json::array({{{"type", "relay-v1"}}});
    info.hints = nlohmann::json::array(
        {{{"type", "relay-v1"},
          {"hints", nlohmann::json::array({{{"type", "websocket-v1"}, {"url", "ws://relay/transit"}, {"priority", 0.0}}})}}});
    Wormhole::ControlMessage original = Wormhole::ControlMessage::make_transit(info);

    Wormhole::ControlMessage decoded = Wormhole::ControlMessage::decode(original.encode());

    ASSERT_EQ(decoded.kind, Wormhole::ControlMessage::Kind::TRANSIT);
    ASSERT_EQ(decoded, original);
}

TEST(ControlMessageTest, OfferWireFormat) {
    Wormhole::ControlMessage offer = Wormhole::ControlMessage::make_offer({"hi.txt", 3});

    nlohmann::json wire = nlohmann::json::parse(offer.encode());
    ASSERT_EQ(wire, nlohmann::json::parse(R"({"offer": {"file": {"filename": "hi.txt", "filesize": 3}}})"));
    ASSERT_EQ(Wormhole::ControlMessage::decode(offer.encode()), offer);
}

TEST(ControlMessageTest, AnswerAndError) {
    Wormhole::ControlMessage answer = Wormhole::ControlMessage::make_answer();
    ASSERT_EQ(nlohmann::json::parse(answer.encode()), nlohmann::json::parse(R"({"answer": {"file_ack": "ok"}})"));
    ASSERT_TRUE(Wormhole::ControlMessage::decode(answer.encode()).answer.accepted());

    Wormhole::ControlMessage error = Wormhole::ControlMessage::decode(bytes(R"({"error": "disk full"})"));
    ASSERT_EQ(error.kind, Wormhole::ControlMessage::Kind::ERROR);
    ASSERT_EQ(error.error, "disk full");
}

TEST(ControlMessageTest, AnswerShapes) {
    // Any answer body decodes; only {"file_ack": "ok"} counts as accepted.
    auto declined = Wormhole::ControlMessage::decode(bytes(R"({"answer": {"file_ack": "no"}})"));
    ASSERT_EQ(declined.kind, Wormhole::ControlMessage::Kind::ANSWER);
    ASSERT_FALSE(declined.answer.accepted());

    auto odd = Wormhole::ControlMessage::decode(bytes(R"({"answer": "ok"})"));
    ASSERT_EQ(odd.kind, Wormhole::ControlMessage::Kind::ANSWER);
    ASSERT_FALSE(odd.answer.accepted());

    auto other_ack = Wormhole::ControlMessage::decode(bytes(R"({"answer": {"message_ack": "ok"}})"));
    ASSERT_FALSE(other_ack.answer.accepted());
}

TEST(ControlMessageTest, ErrorWithNonStringValue) {
    auto error = Wormhole::ControlMessage::decode(bytes(R"({"error": {"code": 7}})"));
    ASSERT_EQ(error.kind, Wormhole::ControlMessage::Kind::ERROR);
    ASSERT_EQ(error.error, R"({"code":7})");
}

TEST(ControlMessageTest, DecodeRejectsNonJson) {
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes("hello")), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(Wormhole::byte_vector()), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode({0xff, 0xfe, 0x00}), Wormhole::MalformedMessage);
}

TEST(ControlMessageTest, DecodeRejectsArrays) {
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"([{"error": "x"}])")), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes("42")), Wormhole::MalformedMessage);
}

TEST(ControlMessageTest, DecodeRejectsZeroOrManyKeys) {
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes("{}")), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"app_versions": {}})")), Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"error": "x", "answer": {"file_ack": "ok"}})")),
                 Wormhole::MalformedMessage);
}

TEST(ControlMessageTest, TryDecodeSkipsUnknownMessages) {
    ASSERT_FALSE(Wormhole::ControlMessage::try_decode(bytes(R"({"app_versions": {}})")).has_value());
    ASSERT_THROW(Wormhole::ControlMessage::try_decode(bytes("[]")), Wormhole::MalformedMessage);

    // Unknown keys next to a recognized one are ignored.
    auto message = Wormhole::ControlMessage::try_decode(bytes(R"({"error": "x", "extra": true})"));
    ASSERT_TRUE(message.has_value());
    ASSERT_EQ(message->error, "x");
}

TEST(ControlMessageTest, DecodeRejectsBadShapes) {
    // Offers need a string filename and an unsigned filesize.
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"offer": {"file": {"filename": "a"}}})")),
                 Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"offer": {"file": {"filename": 1, "filesize": 3}}})")),
                 Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"offer": {"file": {"filename": "a", "filesize": -3}}})")),
                 Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"offer": {"directory": {}}})")),
                 Wormhole::MalformedMessage);

    // Transit messages need both lists.
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"transit": {"abilities-v1": []}})")),
                 Wormhole::MalformedMessage);
    ASSERT_THROW(Wormhole::ControlMessage::decode(bytes(R"({"transit": {"abilities-v1": {}, "hints-v1": []}})")),
                 Wormhole::MalformedMessage);
}

TEST(ControlMessageTest, MalformedIsProtocolViolation) {
    try {
        Wormhole::ControlMessage::decode(bytes("nope"));
        FAIL() << "decode() should have failed";
    } catch (const Wormhole::ProtocolViolation& e) {
        ASSERT_STREQ(e.what(), "bad message came from the other side");
    }
}
