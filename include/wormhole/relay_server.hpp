#ifndef WORMHOLE_RELAY_SERVER_HPP
#define WORMHOLE_RELAY_SERVER_HPP

#include "ws_common.hpp"
#include "mailbox_messages.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Wormhole {
namespace net {

/**
 * @brief Websocket server hosting the rendezvous mailbox and the transit relay.
 *
 * Connections to MAILBOX_RESOURCE speak MailboxFrame JSON: a client binds to
 * an app id, allocates or claims a nameplate shared by at most two sides, and
 * every message added to a nameplate is broadcast to its members and replayed
 * to whoever claims it later. A nameplate is released once all members closed.
 *
 * Connections to TRANSIT_RESOURCE first send a token as text. Two connections
 * with the same token are paired, both receive "ok", and binary frames are
 * forwarded between them until either side closes.
 */
class RelayServer {
public:
    RelayServer();
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /**
     * @brief Starts listening and serves connections on a background thread.
     * @throws RuntimeError if the port cannot be bound.
     */
    void run(uint16_t port);
    void stop();

private:
    enum class Channel {
        MAILBOX,
        TRANSIT
    };

    struct Connection {
        Channel channel;
        std::string app_id;
        std::string side;
        std::string nameplate;
        std::string token;
        WsConnectionHdl partner;
        bool has_partner = false;
    };

    struct Nameplate {
        std::vector<WsConnectionHdl> members;
        std::vector<MailboxFrame> log;
    };

    using Nameplates = std::map<std::string, Nameplate>;

    void on_open(WsConnectionHdl hdl);
    void on_close(WsConnectionHdl hdl);
    void on_message(WsConnectionHdl hdl, WsMessagePtr msg);

    // The methods below expect mutex_ to be held.
    void handle_mailbox(WsConnectionHdl hdl, Connection& connection, const std::string& text);
    void handle_transit(WsConnectionHdl hdl, Connection& connection, WsMessagePtr msg);
    void join_nameplate(WsConnectionHdl hdl, Connection& connection, const std::string& nameplate);
    void leave_nameplate(WsConnectionHdl hdl, Connection& connection);
    std::string free_nameplate(const Nameplates& nameplates) const;
    void send_frame(WsConnectionHdl hdl, const MailboxFrame& frame);
    void send_error(WsConnectionHdl hdl, const std::string& error);

    WsServer server_;
    std::unique_ptr<std::thread> server_thread_;

    std::mutex mutex_;
    std::map<WsConnectionHdl, Connection, std::owner_less<WsConnectionHdl>> connections_;
    // App id to its nameplates.
    std::map<std::string, Nameplates> apps_;
    // Transit connections waiting for their peer, by token.
    std::map<std::string, WsConnectionHdl> waiting_;
};

} // namespace net
} // namespace Wormhole

#endif // WORMHOLE_RELAY_SERVER_HPP
