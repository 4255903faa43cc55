#include "wormhole/ws_transit.hpp"

#include <chrono>
#include <iostream>

#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

namespace Wormhole {
    namespace net {

        namespace {

            constexpr char PAIRED_REPLY[] = "ok";
            constexpr auto CLOSE_GRACE = std::chrono::seconds(2);

        }  // namespace

        // --- WsRecordPipe ---

        WsRecordPipe::WsRecordPipe(byte_vector send_key, byte_vector receive_key)
            : send_key_(std::move(send_key)), receive_key_(std::move(receive_key)) {
            client_.init_asio();
            client_.set_open_handler(std::bind(&WsRecordPipe::on_open, this, std::placeholders::_1));
            client_.set_close_handler(std::bind(&WsRecordPipe::on_close, this, std::placeholders::_1));
            client_.set_fail_handler(std::bind(&WsRecordPipe::on_fail, this, std::placeholders::_1));
            client_.set_message_handler(
                std::bind(&WsRecordPipe::on_message, this, std::placeholders::_1, std::placeholders::_2));
            client_.clear_access_channels(websocketpp::log::alevel::all);
        }

        WsRecordPipe::~WsRecordPipe() {
            close();

            {
                // Give the close handshake a chance before the loop is stopped.
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, CLOSE_GRACE, [this] { return !is_connected_; });
            }
            client_.stop();

            if (client_thread_ && client_thread_->joinable()) {
                client_thread_->join();
            }
        }

        std::future<void> WsRecordPipe::open(const std::string& relay_url, const std::string& token) {
            std::future<void> paired;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (finished_ || client_thread_) {
                    throw LogicError("The transit pipe cannot be opened again.");
                }
                token_ = token;
                ready_.emplace();
                paired = ready_->get_future();
            }

            websocketpp::lib::error_code ec;
            WsClient::connection_ptr con = client_.get_connection(relay_url, ec);
            if (ec) {
                throw RuntimeError("Could not create connection: " + ec.message());
            }
            client_.connect(con);

            client_thread_ = std::make_unique<std::thread>(&WsRecordPipe::run_client, this);
            return paired;
        }

        void WsRecordPipe::run_client() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "Transit client thread exception: " << e.what() << std::endl;
            }
        }

        void WsRecordPipe::fail_ready(std::exception_ptr error) {
            if (ready_) {
                ready_->set_exception(error);
                ready_.reset();
            }
        }

        void WsRecordPipe::send_record(const byte_vector& record) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_ || !is_paired_) {
                throw RuntimeError("the transit connection is closed");
            }

            byte_vector encrypted = Crypto::encrypt_record(record, send_counter_++, send_key_);
            websocketpp::lib::error_code ec;
            client_.send(connection_hdl_, encrypted.data(), encrypted.size(), BINDATA_OPCODE, ec);
            if (ec) {
                throw RuntimeError("sending over the transit failed: " + ec.message());
            }
        }

        std::optional<byte_vector> WsRecordPipe::receive_record() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !records_.empty() || error_ || finished_; });

            if (!records_.empty()) {
                byte_vector record = std::move(records_.front());
                records_.pop_front();
                return record;
            }
            if (error_) {
                std::rethrow_exception(error_);
            }
            return std::nullopt;
        }

        void WsRecordPipe::close() {
            bool stop_now = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closing_) {
                    return;
                }
                closing_ = true;
                finished_ = true;
                fail_ready(std::make_exception_ptr(RuntimeError("the transit connection was closed")));

                if (is_connected_) {
                    websocketpp::lib::error_code ec;
                    client_.close(connection_hdl_, websocketpp::close::status::normal, "", ec);
                    stop_now = static_cast<bool>(ec);
                } else {
                    stop_now = true;
                }
            }
            cv_.notify_all();

            if (stop_now) {
                client_.stop();
            }
        }

        void WsRecordPipe::on_open(WsConnectionHdl hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_hdl_ = hdl;
            is_connected_ = true;

            websocketpp::lib::error_code ec;
            client_.send(hdl, token_, TEXT_OPCODE, ec);
            if (ec) {
                fail_ready(std::make_exception_ptr(RuntimeError("Transit handshake failed: " + ec.message())));
            }
        }

        void WsRecordPipe::on_close(WsConnectionHdl hdl) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                is_connected_ = false;
                finished_ = true;
                fail_ready(std::make_exception_ptr(RuntimeError("the transit relay closed the connection")));
            }
            cv_.notify_all();
        }

        void WsRecordPipe::on_fail(WsConnectionHdl hdl) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                is_connected_ = false;
                finished_ = true;
                fail_ready(std::make_exception_ptr(RuntimeError("could not reach the transit relay")));
            }
            cv_.notify_all();
        }

        void WsRecordPipe::on_message(WsConnectionHdl hdl, WsClientMessagePtr msg) {
            std::lock_guard<std::mutex> lock(mutex_);

            if (msg->get_opcode() == TEXT_OPCODE) {
                if (msg->get_payload() == PAIRED_REPLY && ready_) {
                    is_paired_ = true;
                    ready_->set_value();
                    ready_.reset();
                } else {
                    fail_ready(std::make_exception_ptr(RuntimeError("the transit relay refused us: " + msg->get_payload())));
                }
                return;
            }

            if (!is_paired_ || error_) {
                return;
            }

            const std::string& payload = msg->get_payload();
            byte_vector data(payload.begin(), payload.end());
            try {
                Crypto::DecryptedRecord record = Crypto::decrypt_record(data, receive_key_);
                if (record.counter != expected_counter_) {
                    error_ = std::make_exception_ptr(ProtocolViolation("transit records arrived out of order"));
                } else {
                    expected_counter_++;
                    records_.push_back(std::move(record.data));
                }
            } catch (const RuntimeError& e) {
                error_ = std::make_exception_ptr(IntegrityError(std::string("a transit record was corrupted: ") + e.what()));
            }
            cv_.notify_all();
        }

        // --- WsTransitChannel ---

        WsTransitChannel::WsTransitChannel(std::string transit_relay, Role role)
            : transit_relay_(std::move(transit_relay)), role_(role) {
            if (Crypto::init() != 0) {
                throw RuntimeError("Failed to initialize crypto library.");
            }
            if (!transit_relay_.empty()) {
                relays_.insert(transit_relay_);
            }
        }

        WsTransitChannel::~WsTransitChannel() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled_ = true;
                if (current_) {
                    current_->close();
                }
            }
            if (connect_thread_ && connect_thread_->joinable()) {
                connect_thread_->join();
            }
        }

        std::future<nlohmann::json> WsTransitChannel::get_connection_hints() {
            nlohmann::json hints = nlohmann::json::array();
            if (!transit_relay_.empty()) {
                hints.push_back({
                    {"type", "relay-v1"},
                    {"hints", nlohmann::json::array({
                        {{"type", "websocket-v1"}, {"url", transit_relay_}, {"priority", 0.0}},
                    })},
                });
            }

            std::promise<nlohmann::json> promise;
            promise.set_value(std::move(hints));
            return promise.get_future();
        }

        nlohmann::json WsTransitChannel::get_connection_abilities() const {
            return nlohmann::json::array({{{"type", "relay-v1"}}});
        }

        void WsTransitChannel::add_connection_hints(const nlohmann::json& hints) {
            if (!hints.is_array()) {
                std::cerr << "Ignoring transit hints that are not a list." << std::endl;
                return;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& hint : hints) {
                if (!hint.is_object() || hint.value("type", "") != "relay-v1") {
                    continue;  // Direct connections are not supported
                }
                auto endpoints = hint.find("hints");
                if (endpoints == hint.end() || !endpoints->is_array()) {
                    continue;
                }
                for (const auto& endpoint : *endpoints) {
                    if (!endpoint.is_object() || endpoint.value("type", "") != "websocket-v1") {
                        continue;
                    }
                    auto url = endpoint.find("url");
                    if (url != endpoint.end() && url->is_string()) {
                        relays_.insert(url->get<std::string>());
                    }
                }
            }
        }

        size_t WsTransitChannel::transit_key_length() const {
            return TRANSIT_KEY_BYTES;
        }

        void WsTransitChannel::set_transit_key(const byte_vector& key) {
            if (key.size() != TRANSIT_KEY_BYTES) {
                throw InvalidArgument("Invalid transit key size.");
            }

            byte_vector sender_key = Crypto::derive_key(key, "transit_record_sender_key", TRANSIT_KEY_BYTES);
            byte_vector receiver_key = Crypto::derive_key(key, "transit_record_receiver_key", TRANSIT_KEY_BYTES);

            std::lock_guard<std::mutex> lock(mutex_);
            token_ = Crypto::to_hex(Crypto::derive_key(key, "transit_relay_token", TRANSIT_KEY_BYTES));
            if (role_ == Role::SENDER) {
                send_key_ = std::move(sender_key);
                receive_key_ = std::move(receiver_key);
            } else {
                send_key_ = std::move(receiver_key);
                receive_key_ = std::move(sender_key);
            }
        }

        std::future<std::unique_ptr<RecordPipe>> WsTransitChannel::connect() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (token_.empty()) {
                throw LogicError("The transit key must be set before connecting.");
            }
            if (connect_thread_) {
                throw LogicError("The transit is already connecting.");
            }

            std::future<std::unique_ptr<RecordPipe>> pipe = connect_promise_.get_future();
            if (relays_.empty()) {
                connect_promise_.set_exception(std::make_exception_ptr(RuntimeError("no transit relay is known")));
                return pipe;
            }

            std::vector<std::string> relays(relays_.begin(), relays_.end());
            connect_thread_ = std::make_unique<std::thread>(&WsTransitChannel::run_connect, this, std::move(relays));
            return pipe;
        }

        void WsTransitChannel::run_connect(std::vector<std::string> relays) {
            for (const auto& url : relays) {
                auto pipe = std::make_unique<WsRecordPipe>(send_key_, receive_key_);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (cancelled_) {
                        break;
                    }
                    current_ = pipe.get();
                }

                try {
                    pipe->open(url, token_).get();
                } catch (const std::exception& e) {
                    std::cerr << "Transit relay " << url << " failed: " << e.what() << std::endl;
                    std::lock_guard<std::mutex> lock(mutex_);
                    current_ = nullptr;
                    continue;
                }

                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    current_ = nullptr;
                }
                connect_promise_.set_value(std::move(pipe));
                return;
            }

            connect_promise_.set_exception(std::make_exception_ptr(RuntimeError("could not reach the transit relay")));
        }

        TransitFactory make_transit_factory() {
            return [](const std::string& transit_relay, Role role) -> std::unique_ptr<TransitChannel> {
                return std::make_unique<WsTransitChannel>(transit_relay, role);
            };
        }

    }  // namespace net
}  // namespace Wormhole
