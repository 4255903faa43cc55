#include "wormhole/ws_rendezvous.hpp"

#include <iostream>

#include "wormhole/codes.hpp"
#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

namespace Wormhole {
    namespace net {

        namespace {

            constexpr char PAKE_PHASE[] = "pake";
            constexpr char VERSION_PHASE[] = "version";
            constexpr char VERSION_BODY[] = "{\"app_versions\":{}}";

        }  // namespace

        WsRendezvousClient::WsRendezvousClient(std::string app_id, std::string relay_url)
            : app_id_(std::move(app_id)), relay_url_(std::move(relay_url)) {
            if (Crypto::init() != 0) {
                throw RuntimeError("Failed to initialize crypto library.");
            }
            side_ = Crypto::to_hex(Crypto::random_bytes(5));

            client_.init_asio();
            client_.set_open_handler(std::bind(&WsRendezvousClient::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&WsRendezvousClient::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&WsRendezvousClient::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&WsRendezvousClient::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
        }

        WsRendezvousClient::~WsRendezvousClient() {
            disconnect();
        }

        // --- Connection ---

        void WsRendezvousClient::open_connection() {
            if (client_thread_) {
                return;
            }

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(relay_url_, ec);
            if (ec) {
                throw RuntimeError("could not connect to the server: " + ec.message());
            }
            client_.connect(con);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                send_frame(MailboxFrame::bind(app_id_, side_));
            }
            client_thread_ = std::make_unique<std::thread>(&WsRendezvousClient::run_client, this);
        }

        void WsRendezvousClient::disconnect() {
            if (!client_thread_) {
                return;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (is_connected_) {
                    websocketpp::lib::error_code ec;
                    client_.close(connection_hdl_, websocketpp::close::status::going_away, "", ec);
                    // Failing here only means the connection is already closing.
                }
            }
            client_.stop();

            if (client_thread_->joinable()) {
                client_thread_->join();
            }
            client_thread_.reset();

            std::lock_guard<std::mutex> lock(mutex_);
            is_connected_ = false;
            fail_pending(std::make_exception_ptr(RuntimeError("the wormhole is closed")));
        }

        void WsRendezvousClient::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "Rendezvous client thread exception: " << e.what() << std::endl;
            }
        }

        void WsRendezvousClient::send_frame(const MailboxFrame& frame) {
            std::string text = frame.serialize();
            if (!is_connected_) {
                if (!connection_error_) {
                    outbox_.push_back(std::move(text));
                }
                return;
            }

            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, text, TEXT_OPCODE, ec);
            if (ec) {
                std::cerr << "Error sending mailbox frame: " << ec.message() << std::endl;
            }
        }

        void WsRendezvousClient::fail_pending(std::exception_ptr error) {
            if (!connection_error_) {
                connection_error_ = error;
            }
            outbox_.clear();

            if (code_promise_) {
                code_promise_->set_exception(error);
                code_promise_.reset();
            }
            if (claim_promise_) {
                claim_promise_->set_exception(error);
                claim_promise_.reset();
            }
            if (!verifier_ && !verifier_error_) {
                verifier_error_ = error;
            }
            for (auto& waiter : verifier_waiters_) {
                waiter.set_exception(error);
            }
            verifier_waiters_.clear();
            for (auto& waiter : message_waiters_) {
                waiter.set_exception(error);
            }
            message_waiters_.clear();
            for (auto& waiter : close_waiters_) {
                waiter.set_value();
            }
            close_waiters_.clear();
        }

        // --- RendezvousClient ---

        std::future<std::string> WsRendezvousClient::allocate_code() {
            std::future<std::string> code;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (code_promise_ || claim_promise_ || !code_.empty()) {
                    throw LogicError("A code has already been set for this wormhole.");
                }
                code_promise_.emplace();
                code = code_promise_->get_future();
            }

            open_connection();

            std::lock_guard<std::mutex> lock(mutex_);
            send_frame(MailboxFrame::allocate());
            return code;
        }

        std::future<void> WsRendezvousClient::set_code(const std::string& code) {
            std::string nameplate = nameplate_of(code);

            std::future<void> claimed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (code_promise_ || claim_promise_ || !code_.empty()) {
                    throw LogicError("A code has already been set for this wormhole.");
                }
                claim_promise_.emplace();
                claimed = claim_promise_->get_future();
                code_ = code;
            }

            open_connection();

            std::lock_guard<std::mutex> lock(mutex_);
            send_frame(MailboxFrame::claim(nameplate));
            start_pake();
            return claimed;
        }

        byte_vector WsRendezvousClient::derive_key(const std::string& purpose, size_t length) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (key_.empty()) {
                throw LogicError("The key exchange has not completed yet.");
            }
            return Crypto::derive_key(key_, purpose, length);
        }

        std::future<Verifier> WsRendezvousClient::get_verifier() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::promise<Verifier> waiter;
            std::future<Verifier> verifier = waiter.get_future();
            if (verifier_) {
                waiter.set_value(*verifier_);
            } else if (verifier_error_) {
                waiter.set_exception(verifier_error_);
            } else {
                verifier_waiters_.push_back(std::move(waiter));
            }
            return verifier;
        }

        void WsRendezvousClient::send_message(const byte_vector& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (is_closing_) {
                throw LogicError("The wormhole is closed.");
            }
            if (key_.empty()) {
                unsent_.push_back(message);
                return;
            }
            send_application(message);
        }

        std::future<byte_vector> WsRendezvousClient::get_message() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!inbox_.empty()) {
                std::future<byte_vector> message = std::move(inbox_.front());
                inbox_.pop_front();
                return message;
            }

            std::promise<byte_vector> waiter;
            std::future<byte_vector> message = waiter.get_future();
            if (connection_error_) {
                waiter.set_exception(connection_error_);
            } else {
                message_waiters_.push_back(std::move(waiter));
            }
            return message;
        }

        std::future<void> WsRendezvousClient::close() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::promise<void> waiter;
            std::future<void> closed = waiter.get_future();
            if (!client_thread_ || !is_connected_) {
                waiter.set_value();
                return closed;
            }

            is_closing_ = true;
            close_waiters_.push_back(std::move(waiter));
            send_frame(MailboxFrame::close());
            return closed;
        }

        // --- Key agreement ---

        byte_vector WsRendezvousClient::phase_key(const std::string& side, const std::string& phase) const {
            return Crypto::derive_key(key_, "wormhole:phase:" + side + ":" + phase, crypto_secretbox_KEYBYTES);
        }

        void WsRendezvousClient::start_pake() {
            spake_ = std::make_unique<Spake2>(code_, app_id_);
            send_frame(MailboxFrame::add(PAKE_PHASE, spake_->start()));

            if (early_pake_) {
                byte_vector body = std::move(*early_pake_);
                early_pake_.reset();
                handle_pake(body);
            }
        }

        void WsRendezvousClient::handle_pake(const byte_vector& body) {
            if (!spake_) {
                early_pake_ = body;
                return;
            }
            if (!key_.empty()) {
                return;  // Duplicate
            }

            try {
                key_ = spake_->finish(body);
            } catch (const InvalidArgument& e) {
                std::cerr << "Key exchange failed: " << e.what() << std::endl;
                verifier_error_ = std::make_exception_ptr(WrongSecretError("the key exchange with the other end failed"));
                for (auto& waiter : verifier_waiters_) {
                    waiter.set_exception(verifier_error_);
                }
                verifier_waiters_.clear();
                return;
            }

            byte_vector version(VERSION_BODY, VERSION_BODY + sizeof(VERSION_BODY) - 1);
            send_frame(MailboxFrame::add(VERSION_PHASE, Crypto::seal(version, phase_key(side_, VERSION_PHASE))));

            for (const auto& message : unsent_) {
                send_application(message);
            }
            unsent_.clear();
        }

        void WsRendezvousClient::handle_version(const byte_vector& body) {
            if (key_.empty() || verifier_ || verifier_error_) {
                return;
            }

            try {
                Crypto::open(body, phase_key(peer_side_, VERSION_PHASE));
                verifier_ = Crypto::derive_key(key_, "wormhole:verifier", 32);
                for (auto& waiter : verifier_waiters_) {
                    waiter.set_value(*verifier_);
                }
            } catch (const RuntimeError&) {
                // Only a different code leads to a box we cannot open.
                verifier_error_ = std::make_exception_ptr(WrongSecretError("the other end used a different code"));
                for (auto& waiter : verifier_waiters_) {
                    waiter.set_exception(verifier_error_);
                }
            }
            verifier_waiters_.clear();
        }

        // --- Application messages ---

        void WsRendezvousClient::send_application(const byte_vector& message) {
            std::string phase = std::to_string(next_phase_++);
            send_frame(MailboxFrame::add(phase, Crypto::seal(message, phase_key(side_, phase))));
        }

        void WsRendezvousClient::handle_application(const std::string& phase, const byte_vector& body) {
            if (!verifier_) {
                std::cerr << "Dropping message in phase " << phase << " received before key confirmation." << std::endl;
                return;
            }

            try {
                deliver(Crypto::open(body, phase_key(peer_side_, phase)), nullptr);
            } catch (const RuntimeError&) {
                deliver(byte_vector(), std::make_exception_ptr(MalformedMessage("bad message came from the other side")));
            }
        }

        void WsRendezvousClient::deliver(byte_vector message, std::exception_ptr error) {
            std::promise<byte_vector> slot;
            if (!message_waiters_.empty()) {
                slot = std::move(message_waiters_.front());
                message_waiters_.pop_front();
            } else {
                inbox_.push_back(slot.get_future());
            }

            if (error) {
                slot.set_exception(error);
            } else {
                slot.set_value(std::move(message));
            }
        }

        // --- Handlers ---

        void WsRendezvousClient::on_open(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_hdl_ = hdl;
            is_connected_ = true;

            for (const auto& text : outbox_) {
                websocketpp::lib::error_code ec;
                client_.send(hdl, text, TEXT_OPCODE, ec);
                if (ec) {
                    std::cerr << "Error sending mailbox frame: " << ec.message() << std::endl;
                }
            }
            outbox_.clear();
        }

        void WsRendezvousClient::on_close(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            is_connected_ = false;
            fail_pending(std::make_exception_ptr(RuntimeError("lost the connection to the server")));
        }

        void WsRendezvousClient::on_fail(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            is_connected_ = false;
            fail_pending(std::make_exception_ptr(RuntimeError("could not connect to the server")));
        }

        void WsRendezvousClient::on_message(WsConnectionHdl hdl, WsClientMessagePtr msg) {
            if (msg->get_opcode() != TEXT_OPCODE) {
                return;  // Ignore non-text messages
            }

            try {
                MailboxFrame frame = MailboxFrame::deserialize(msg->get_payload());
                std::lock_guard<std::mutex> lock(mutex_);

                if (frame.type == "allocated") {
                    if (!code_promise_) {
                        return;
                    }
                    code_ = make_code(frame.nameplate);
                    start_pake();
                    code_promise_->set_value(code_);
                    code_promise_.reset();
                } else if (frame.type == "claimed") {
                    if (claim_promise_) {
                        claim_promise_->set_value();
                        claim_promise_.reset();
                    }
                } else if (frame.type == "message") {
                    if (frame.side == side_) {
                        return;  // Our own message echoed back
                    }
                    peer_side_ = frame.side;
                    if (frame.phase == PAKE_PHASE) {
                        handle_pake(frame.body);
                    } else if (frame.phase == VERSION_PHASE) {
                        handle_version(frame.body);
                    } else {
                        handle_application(frame.phase, frame.body);
                    }
                } else if (frame.type == "closed") {
                    for (auto& waiter : close_waiters_) {
                        waiter.set_value();
                    }
                    close_waiters_.clear();
                } else if (frame.type == "error") {
                    auto error = std::make_exception_ptr(
                        RuntimeError(frame.error.empty() ? "the server refused the request" : frame.error));
                    if (code_promise_) {
                        code_promise_->set_exception(error);
                        code_promise_.reset();
                    }
                    if (claim_promise_) {
                        claim_promise_->set_exception(error);
                        claim_promise_.reset();
                    }
                }
            } catch (const std::exception& e) {
                std::cerr << "Mailbox frame processing failed: " << e.what() << std::endl;
            }
        }

    }  // namespace net
}  // namespace Wormhole
