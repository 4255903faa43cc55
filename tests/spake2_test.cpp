#include "wormhole/spake2.hpp"

#include <gtest/gtest.h>

#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

TEST(Spake2Test, SameCodeAgrees) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::Spake2 sender("7-guitarist-revenue", "lothar.com/wormhole/text-or-file-xfer");
    Wormhole::Spake2 receiver("7-guitarist-revenue", "lothar.com/wormhole/text-or-file-xfer");

    Wormhole::byte_vector sender_msg = sender.start();
    Wormhole::byte_vector receiver_msg = receiver.start();
    ASSERT_NE(sender_msg, receiver_msg);

    Wormhole::byte_vector sender_key = sender.finish(receiver_msg);
    Wormhole::byte_vector receiver_key = receiver.finish(sender_msg);

    ASSERT_EQ(sender_key.size(), Wormhole::Spake2::KEY_BYTES);
    ASSERT_EQ(sender_key, receiver_key);
}

TEST(Spake2Test, DifferentCodesDisagree) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::Spake2 sender("7-guitarist-revenue", "app");
    Wormhole::Spake2 receiver("7-guitarist-revenues", "app");

    Wormhole::byte_vector sender_msg = sender.start();
    Wormhole::byte_vector receiver_msg = receiver.start();

    ASSERT_NE(sender.finish(receiver_msg), receiver.finish(sender_msg));
}

TEST(Spake2Test, DifferentAppIdsDisagree) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::Spake2 sender("7-guitarist-revenue", "app-one");
    Wormhole::Spake2 receiver("7-guitarist-revenue", "app-two");

    Wormhole::byte_vector sender_msg = sender.start();
    Wormhole::byte_vector receiver_msg = receiver.start();

    ASSERT_NE(sender.finish(receiver_msg), receiver.finish(sender_msg));
}

TEST(Spake2Test, FreshKeysPerRun) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::Spake2 first_a("7-guitarist-revenue", "app");
    Wormhole::Spake2 first_b("7-guitarist-revenue", "app");
    Wormhole::byte_vector a_msg = first_a.start();
    Wormhole::byte_vector first_key = first_a.finish(first_b.start());
    first_b.finish(a_msg);

    Wormhole::Spake2 second_a("7-guitarist-revenue", "app");
    Wormhole::Spake2 second_b("7-guitarist-revenue", "app");
    Wormhole::byte_vector second_msg = second_a.start();
    Wormhole::byte_vector second_key = second_a.finish(second_b.start());
    second_b.finish(second_msg);

    ASSERT_NE(first_key, second_key);
}

TEST(Spake2Test, UsageErrors) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::Spake2 peer("7-guitarist-revenue", "app");
    Wormhole::byte_vector peer_msg = peer.start();

    Wormhole::Spake2 spake("7-guitarist-revenue", "app");
    ASSERT_THROW(spake.finish(peer_msg), Wormhole::LogicError);

    spake.start();
    ASSERT_THROW(spake.start(), Wormhole::LogicError);

    // Not a group element
    ASSERT_THROW(spake.finish(Wormhole::byte_vector(5, 0x01)), Wormhole::InvalidArgument);
    ASSERT_THROW(spake.finish(Wormhole::byte_vector(32, 0x00)), Wormhole::InvalidArgument);
}
