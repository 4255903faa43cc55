#include "wormhole/relay_server.hpp"

#include <algorithm>
#include <iostream>

#include "wormhole/errors.hpp"

namespace Wormhole {
    namespace net {

        namespace {

            constexpr size_t NAMEPLATE_MEMBERS = 2;
            constexpr char PAIRED_REPLY[] = "ok";

            bool same_connection(const WsConnectionHdl& a, const WsConnectionHdl& b) {
                return !a.owner_before(b) && !b.owner_before(a);
            }

            MailboxFrame reply(const std::string& type) {
                MailboxFrame frame;
                frame.type = type;
                return frame;
            }

        }  // namespace

        RelayServer::RelayServer() {
            server_.init_asio();
            server_.set_reuse_addr(true);
            server_.set_open_handler(std::bind(&RelayServer::on_open, this, std::placeholders::_1));
            server_.set_close_handler(std::bind(&RelayServer::on_close, this, std::placeholders::_1));
            server_.set_message_handler(
                std::bind(&RelayServer::on_message, this, std::placeholders::_1, std::placeholders::_2));
            server_.clear_access_channels(websocketpp::log::alevel::all);
        }

        RelayServer::~RelayServer() {
            stop();
        }

        void RelayServer::run(uint16_t port) {
            if (server_thread_) {
                throw LogicError("The relay server is already running.");
            }

            websocketpp::lib::error_code ec;
            server_.listen(port, ec);
            if (ec) {
                throw RuntimeError("Could not listen on port " + std::to_string(port) + ": " + ec.message());
            }
            server_.start_accept(ec);
            if (ec) {
                throw RuntimeError("Could not accept connections: " + ec.message());
            }

            server_thread_ = std::make_unique<std::thread>([this]() {
                try {
                    server_.run();
                } catch (const std::exception& e) {
                    std::cerr << "Server thread exception: " << e.what() << std::endl;
                }
            });
        }

        void RelayServer::stop() {
            if (server_.is_listening()) {
                websocketpp::lib::error_code ec;
                server_.stop_listening(ec);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto const& [hdl, connection] : connections_) {
                    websocketpp::lib::error_code ec;
                    server_.close(hdl, websocketpp::close::status::going_away, "Server shutdown", ec);
                    // An error only means the connection is already closing.
                }
                connections_.clear();
                apps_.clear();
                waiting_.clear();
            }

            if (server_thread_ && server_thread_->joinable()) {
                server_thread_->join();
            }
            server_thread_.reset();
        }

        // --- Handlers ---

        void RelayServer::on_open(WsConnectionHdl hdl) {
            websocketpp::lib::error_code ec;
            WsServer::connection_ptr con = server_.get_con_from_hdl(hdl, ec);
            if (ec) {
                return;
            }

            Connection connection;
            const std::string& resource = con->get_resource();
            if (resource == MAILBOX_RESOURCE) {
                connection.channel = Channel::MAILBOX;
            } else if (resource == TRANSIT_RESOURCE) {
                connection.channel = Channel::TRANSIT;
            } else {
                server_.close(hdl, websocketpp::close::status::policy_violation, "Unknown resource", ec);
                return;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            connections_[hdl] = std::move(connection);
        }

        void RelayServer::on_close(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(hdl);
            if (it == connections_.end()) {
                return;
            }

            Connection& connection = it->second;
            if (connection.channel == Channel::MAILBOX) {
                leave_nameplate(hdl, connection);
            } else {
                auto waiting = waiting_.find(connection.token);
                if (waiting != waiting_.end() && same_connection(waiting->second, hdl)) {
                    waiting_.erase(waiting);
                }
                if (connection.has_partner) {
                    websocketpp::lib::error_code ec;
                    server_.close(connection.partner, websocketpp::close::status::normal, "Peer closed", ec);
                }
            }
            connections_.erase(it);
        }

        void RelayServer::on_message(WsConnectionHdl hdl, WsMessagePtr msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(hdl);
            if (it == connections_.end()) {
                return;
            }

            if (it->second.channel == Channel::TRANSIT) {
                handle_transit(hdl, it->second, msg);
            } else if (msg->get_opcode() == TEXT_OPCODE) {
                handle_mailbox(hdl, it->second, msg->get_payload());
            }
        }

        // --- Mailbox ---

        void RelayServer::handle_mailbox(WsConnectionHdl hdl, Connection& connection, const std::string& text) {
            MailboxFrame frame;
            try {
                frame = MailboxFrame::deserialize(text);
            } catch (const MalformedMessage& e) {
                send_error(hdl, e.what());
                return;
            }

            if (frame.type == "bind") {
                if (!connection.app_id.empty()) {
                    send_error(hdl, "already bound");
                } else if (frame.app_id.empty() || frame.side.empty()) {
                    send_error(hdl, "bind requires appid and side");
                } else {
                    connection.app_id = frame.app_id;
                    connection.side = frame.side;
                }
                return;
            }

            if (connection.app_id.empty()) {
                send_error(hdl, "must bind first");
                return;
            }

            if (frame.type == "allocate" || frame.type == "claim") {
                if (!connection.nameplate.empty()) {
                    send_error(hdl, "only one nameplate per connection");
                    return;
                }

                Nameplates& nameplates = apps_[connection.app_id];
                std::string nameplate;
                if (frame.type == "allocate") {
                    nameplate = free_nameplate(nameplates);
                } else {
                    nameplate = frame.nameplate;
                    if (nameplate.empty()) {
                        send_error(hdl, "claim requires a nameplate");
                        return;
                    }
                    auto existing = nameplates.find(nameplate);
                    if (existing != nameplates.end() && existing->second.members.size() >= NAMEPLATE_MEMBERS) {
                        send_error(hdl, "crowded");
                        return;
                    }
                }

                MailboxFrame answer = reply(frame.type == "allocate" ? "allocated" : "claimed");
                answer.nameplate = nameplate;
                send_frame(hdl, answer);
                join_nameplate(hdl, connection, nameplate);
            } else if (frame.type == "add") {
                if (connection.nameplate.empty()) {
                    send_error(hdl, "must allocate or claim first");
                    return;
                }

                MailboxFrame message = reply("message");
                message.side = connection.side;
                message.phase = frame.phase;
                message.body = frame.body;

                Nameplate& nameplate = apps_[connection.app_id][connection.nameplate];
                nameplate.log.push_back(message);
                for (const auto& member : nameplate.members) {
                    send_frame(member, message);
                }
            } else if (frame.type == "close") {
                leave_nameplate(hdl, connection);
                send_frame(hdl, reply("closed"));
            } else {
                send_error(hdl, "unknown type " + frame.type);
            }
        }

        void RelayServer::join_nameplate(WsConnectionHdl hdl, Connection& connection, const std::string& name) {
            Nameplate& nameplate = apps_[connection.app_id][name];
            nameplate.members.push_back(hdl);
            connection.nameplate = name;

            for (const auto& message : nameplate.log) {
                send_frame(hdl, message);
            }
        }

        void RelayServer::leave_nameplate(WsConnectionHdl hdl, Connection& connection) {
            if (connection.nameplate.empty()) {
                return;
            }

            auto app = apps_.find(connection.app_id);
            if (app != apps_.end()) {
                auto nameplate = app->second.find(connection.nameplate);
                if (nameplate != app->second.end()) {
                    auto& members = nameplate->second.members;
                    members.erase(std::remove_if(members.begin(),
                                                 members.end(),
                                                 [&hdl](const WsConnectionHdl& member) {
                                                     return same_connection(member, hdl);
                                                 }),
                                  members.end());
                    if (members.empty()) {
                        app->second.erase(nameplate);
                    }
                }
                if (app->second.empty()) {
                    apps_.erase(app);
                }
            }
            connection.nameplate.clear();
        }

        std::string RelayServer::free_nameplate(const Nameplates& nameplates) const {
            for (size_t number = 1;; ++number) {
                std::string candidate = std::to_string(number);
                if (nameplates.find(candidate) == nameplates.end()) {
                    return candidate;
                }
            }
        }

        void RelayServer::send_frame(WsConnectionHdl hdl, const MailboxFrame& frame) {
            websocketpp::lib::error_code ec;
            server_.send(hdl, frame.serialize(), TEXT_OPCODE, ec);
            if (ec) {
                std::cerr << "Error sending mailbox frame: " << ec.message() << std::endl;
            }
        }

        void RelayServer::send_error(WsConnectionHdl hdl, const std::string& error) {
            MailboxFrame frame = reply("error");
            frame.error = error;
            send_frame(hdl, frame);
        }

        // --- Transit ---

        void RelayServer::handle_transit(WsConnectionHdl hdl, Connection& connection, WsMessagePtr msg) {
            websocketpp::lib::error_code ec;

            if (msg->get_opcode() == TEXT_OPCODE) {
                if (!connection.token.empty() || msg->get_payload().empty()) {
                    server_.close(hdl, websocketpp::close::status::protocol_error, "Unexpected handshake", ec);
                    return;
                }
                connection.token = msg->get_payload();

                auto waiting = waiting_.find(connection.token);
                if (waiting == waiting_.end()) {
                    waiting_[connection.token] = hdl;
                    return;
                }

                WsConnectionHdl peer_hdl = waiting->second;
                waiting_.erase(waiting);
                auto peer = connections_.find(peer_hdl);
                if (peer == connections_.end()) {
                    waiting_[connection.token] = hdl;
                    return;
                }

                connection.partner = peer_hdl;
                connection.has_partner = true;
                peer->second.partner = hdl;
                peer->second.has_partner = true;

                for (const auto& member : {peer_hdl, hdl}) {
                    server_.send(member, std::string(PAIRED_REPLY), TEXT_OPCODE, ec);
                    if (ec) {
                        std::cerr << "Error pairing transit connections: " << ec.message() << std::endl;
                    }
                }
                return;
            }

            if (!connection.has_partner) {
                return;  // Data before pairing is dropped
            }
            const std::string& payload = msg->get_payload();
            server_.send(connection.partner, payload.data(), payload.size(), BINDATA_OPCODE, ec);
            if (ec) {
                std::cerr << "Error forwarding transit data: " << ec.message() << std::endl;
            }
        }

    }  // namespace net
}  // namespace Wormhole
