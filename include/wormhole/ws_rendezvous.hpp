#ifndef WORMHOLE_WS_RENDEZVOUS_HPP
#define WORMHOLE_WS_RENDEZVOUS_HPP

#include "ws_common.hpp"
#include "mailbox_messages.hpp"
#include "rendezvous.hpp"
#include "spake2.hpp"

#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Wormhole {
namespace net {

/**
 * @brief Rendezvous client talking to the mailbox served by net::RelayServer.
 *
 * Phases on the mailbox: "pake" carries the SPAKE2 element, "version"
 * confirms the key (a box the other end can only open with the same key),
 * "0", "1", ... carry application messages sealed with per-phase keys.
 *
 * The public methods are meant to be called from a single thread; the
 * websocket handlers run on the client's own thread.
 */
class WsRendezvousClient : public RendezvousClient {
public:
    WsRendezvousClient(std::string app_id, std::string relay_url);
    ~WsRendezvousClient() override;

    std::future<std::string> allocate_code() override;
    std::future<void> set_code(const std::string& code) override;
    byte_vector derive_key(const std::string& purpose, size_t length) override;
    std::future<Verifier> get_verifier() override;
    void send_message(const byte_vector& message) override;
    std::future<byte_vector> get_message() override;
    std::future<void> close() override;

private:
    void open_connection();
    void disconnect();
    void run_client();

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsClientMessagePtr msg);

    // The methods below expect mutex_ to be held.
    void send_frame(const MailboxFrame& frame);
    void start_pake();
    void handle_pake(const byte_vector& body);
    void handle_version(const byte_vector& body);
    void handle_application(const std::string& phase, const byte_vector& body);
    void send_application(const byte_vector& message);
    void deliver(byte_vector message, std::exception_ptr error);
    void fail_pending(std::exception_ptr error);
    byte_vector phase_key(const std::string& side, const std::string& phase) const;

    std::string app_id_;
    std::string relay_url_;
    std::string side_;

    WsClient client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;

    std::mutex mutex_;
    bool is_connected_ = false;
    bool is_closing_ = false;
    std::exception_ptr connection_error_;
    std::vector<std::string> outbox_;

    std::string code_;
    std::string peer_side_;
    std::unique_ptr<Spake2> spake_;
    std::optional<byte_vector> early_pake_;
    byte_vector key_;
    std::optional<Verifier> verifier_;
    std::exception_ptr verifier_error_;
    uint64_t next_phase_ = 0;
    std::vector<byte_vector> unsent_;

    std::optional<std::promise<std::string>> code_promise_;
    std::optional<std::promise<void>> claim_promise_;
    std::vector<std::promise<Verifier>> verifier_waiters_;
    // Messages nobody asked for yet, already resolved.
    std::deque<std::future<byte_vector>> inbox_;
    std::deque<std::promise<byte_vector>> message_waiters_;
    std::vector<std::promise<void>> close_waiters_;
};

} // namespace net
} // namespace Wormhole

#endif // WORMHOLE_WS_RENDEZVOUS_HPP
