#include "wormhole/relay_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "fakes.hpp"
#include "wormhole/codes.hpp"
#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"
#include "wormhole/session.hpp"
#include "wormhole/ws_rendezvous.hpp"
#include "wormhole/ws_transit.hpp"

using namespace std::chrono_literals;

namespace {

Wormhole::Config local_config(uint16_t port) {
    Wormhole::Config config;
    config.rendezvous_relay = "ws://127.0.0.1:" + std::to_string(port) + "/v1";
    config.transit_relay = "ws://127.0.0.1:" + std::to_string(port) + "/transit";
    config.message_timeout = std::chrono::seconds(10);
    config.transit_timeout = std::chrono::seconds(10);
    return config;
}

std::unique_ptr<Wormhole::Session> open_session(const Wormhole::Config& config) {
    return std::make_unique<Wormhole::Session>(
        config,
        std::make_unique<Wormhole::net::WsRendezvousClient>(config.app_id, config.rendezvous_relay),
        Wormhole::net::make_transit_factory());
}

}  // namespace

TEST(RelayIntegrationTest, SendFileThroughRelay) {
    // 1. Start the relay
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    const uint16_t port = 47411;
    Wormhole::net::RelayServer server;
    server.run(port);

    fakes::TempDir dir;
    std::string contents(40000, 'w');
    fakes::write_file(dir.file("payload.bin"), contents);

    Wormhole::Config config = local_config(port);
    auto sender = open_session(config);
    auto receiver = open_session(config);

    // 2. The sender allocates a code and waits on its own thread
    std::string code = sender->generate_code(5s);
    ASSERT_EQ(Wormhole::nameplate_of(code), "1");

    std::future<std::pair<Wormhole::Verifier, std::string>> sent = std::async(std::launch::async, [&]() {
        Wormhole::Verifier verifier = sender->exchange_keys(10s);
        std::string digest = sender->send_file(dir.file("payload.bin"));
        return std::make_pair(verifier, digest);
    });

    // 3. The receiver joins with the code
    receiver->connect(code, 5s);
    Wormhole::Verifier verifier = receiver->exchange_keys(10s);
    Wormhole::FileOffer offer = receiver->await_offer();
    ASSERT_EQ(offer.filename, "payload.bin");
    ASSERT_EQ(offer.filesize, contents.size());

    std::string digest = receiver->accept_offer(dir.file("received.bin"));

    // 4. Both ends saw the same key and the same bytes
    ASSERT_EQ(sent.wait_for(20s), std::future_status::ready);
    auto [sender_verifier, sender_digest] = sent.get();
    ASSERT_EQ(sender_verifier, verifier);
    ASSERT_EQ(verifier.size(), 32u);
    ASSERT_EQ(sender_digest, digest);
    ASSERT_EQ(fakes::read_file(dir.file("received.bin")), contents);

    sender->close();
    receiver->close();
    server.stop();
}

TEST(RelayIntegrationTest, WrongCodeFailsOnBothEnds) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    const uint16_t port = 47412;
    Wormhole::net::RelayServer server;
    server.run(port);

    Wormhole::Config config = local_config(port);
    auto sender = open_session(config);
    auto receiver = open_session(config);

    std::string code = sender->generate_code(5s);
    std::future<void> sender_keys = std::async(std::launch::async, [&]() { sender->exchange_keys(10s); });

    // Right nameplate, wrong words
    receiver->connect(Wormhole::nameplate_of(code) + "-not-it", 5s);
    ASSERT_THROW(receiver->exchange_keys(10s), Wormhole::HumanProtocolError);
    ASSERT_THROW(sender_keys.get(), Wormhole::HumanProtocolError);

    sender->close();
    receiver->close();
    server.stop();
}

TEST(RelayIntegrationTest, NameplateHoldsTwoSides) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    const uint16_t port = 47413;
    Wormhole::net::RelayServer server;
    server.run(port);

    Wormhole::Config config = local_config(port);
    auto sender = open_session(config);
    auto receiver = open_session(config);
    auto intruder = open_session(config);

    std::string code = sender->generate_code(5s);
    receiver->connect(code, 5s);

    ASSERT_THROW(intruder->connect(code, 5s), Wormhole::RuntimeError);
    ASSERT_EQ(intruder->state(), Wormhole::SessionState::ERROR);

    sender->close();
    receiver->close();
    intruder->close();
    server.stop();
}
