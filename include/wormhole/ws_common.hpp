#ifndef WORMHOLE_WS_COMMON_HPP
#define WORMHOLE_WS_COMMON_HPP

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/client.hpp>

namespace Wormhole {
namespace net {

    // Define types for convenience
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using WsClient = websocketpp::client<websocketpp::config::asio>;
    using WsConnectionHdl = websocketpp::connection_hdl;
    using WsMessagePtr = WsServer::message_ptr;
    using WsClientMessagePtr = WsClient::message_ptr;

    // Mailbox frames are JSON text, transit records are binary.
    const websocketpp::frame::opcode::value TEXT_OPCODE = websocketpp::frame::opcode::text;
    const websocketpp::frame::opcode::value BINDATA_OPCODE = websocketpp::frame::opcode::binary;

    // Resources served by the relay server.
    constexpr char MAILBOX_RESOURCE[] = "/v1";
    constexpr char TRANSIT_RESOURCE[] = "/transit";

} // namespace net
} // namespace Wormhole

#endif // WORMHOLE_WS_COMMON_HPP
