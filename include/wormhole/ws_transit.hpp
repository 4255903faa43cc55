#ifndef WORMHOLE_WS_TRANSIT_HPP
#define WORMHOLE_WS_TRANSIT_HPP

#include "ws_common.hpp"
#include "transit.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace Wormhole {
namespace net {

/**
 * @brief A record pipe through the transit relay.
 *
 * After the websocket opens, the pipe presents the channel token as a text
 * frame; the relay answers "ok" once both ends presented the same token and
 * from then on forwards binary frames between them. Every record is
 * encrypted with a per-role key and carries a counter that must increase by
 * exactly one.
 */
class WsRecordPipe : public RecordPipe {
public:
    WsRecordPipe(byte_vector send_key, byte_vector receive_key);
    ~WsRecordPipe() override;

    WsRecordPipe(const WsRecordPipe&) = delete;
    WsRecordPipe& operator=(const WsRecordPipe&) = delete;

    /**
     * @brief Connects to a relay and presents the channel token.
     * @return A future resolving once the relay paired us with the other end.
     * @throws RuntimeError if the connection cannot be created.
     */
    std::future<void> open(const std::string& relay_url, const std::string& token);

    void send_record(const byte_vector& record) override;
    std::optional<byte_vector> receive_record() override;
    void close() override;

private:
    void run_client();
    void fail_ready(std::exception_ptr error);

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_fail(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsClientMessagePtr msg);

    byte_vector send_key_;
    byte_vector receive_key_;
    std::string token_;

    WsClient client_;
    WsConnectionHdl connection_hdl_;
    std::unique_ptr<std::thread> client_thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool is_connected_ = false;
    bool is_paired_ = false;
    bool finished_ = false;
    bool closing_ = false;
    std::optional<std::promise<void>> ready_;
    std::deque<byte_vector> records_;
    std::exception_ptr error_;
    uint64_t send_counter_ = 0;
    uint64_t expected_counter_ = 0;
};

/**
 * @brief Transit through one or more websocket relays.
 *
 * Both ends advertise their relay in the hints and try the sorted union of
 * all known relays in the same order, so they meet on the first relay both
 * can reach.
 */
class WsTransitChannel : public TransitChannel {
public:
    static constexpr size_t TRANSIT_KEY_BYTES = 32;

    WsTransitChannel(std::string transit_relay, Role role);
    ~WsTransitChannel() override;

    std::future<nlohmann::json> get_connection_hints() override;
    nlohmann::json get_connection_abilities() const override;
    void add_connection_hints(const nlohmann::json& hints) override;
    size_t transit_key_length() const override;
    void set_transit_key(const byte_vector& key) override;

    /**
     * @throws LogicError if no transit key was set or connect() was already called.
     */
    std::future<std::unique_ptr<RecordPipe>> connect() override;

private:
    void run_connect(std::vector<std::string> relays);

    std::string transit_relay_;
    Role role_;
    std::set<std::string> relays_;

    std::string token_;
    byte_vector send_key_;
    byte_vector receive_key_;

    std::mutex mutex_;
    bool cancelled_ = false;
    WsRecordPipe* current_ = nullptr;
    std::promise<std::unique_ptr<RecordPipe>> connect_promise_;
    std::unique_ptr<std::thread> connect_thread_;
};

/**
 * @brief Factory producing WsTransitChannel instances, for Session.
 */
TransitFactory make_transit_factory();

} // namespace net
} // namespace Wormhole

#endif // WORMHOLE_WS_TRANSIT_HPP
