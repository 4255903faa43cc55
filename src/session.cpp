#include "wormhole/session.hpp"
#include "wormhole/errors.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace Wormhole {

namespace {

template <typename T>
T wait_for_result(std::future<T>& future, std::chrono::milliseconds timeout, const char* timeout_message) {
    if (future.wait_for(timeout) == std::future_status::timeout) {
        throw TimeoutError(timeout_message);
    }
    return future.get();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::CODE_READY: return "code ready";
        case SessionState::CONNECTING: return "connecting";
        case SessionState::KEYS_EXCHANGED: return "keys exchanged";
        case SessionState::TRANSIT_NEGOTIATING: return "negotiating transit";
        case SessionState::OFFER_SENT: return "offer sent";
        case SessionState::AWAITING_OFFER: return "awaiting offer";
        case SessionState::OFFER_RECEIVED: return "offer received";
        case SessionState::ACCEPTING: return "accepting";
        case SessionState::TRANSFERRING: return "transferring";
        case SessionState::DONE: return "done";
        case SessionState::ERROR: return "error";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

Session::Session(Config config, std::unique_ptr<RendezvousClient> rendezvous, TransitFactory transit_factory)
    : config_(std::move(config)), rendezvous_(std::move(rendezvous)), transit_factory_(std::move(transit_factory)) {
    if (!rendezvous_) {
        throw InvalidArgument("A session needs a rendezvous client.");
    }
    if (!transit_factory_) {
        throw InvalidArgument("A session needs a transit factory.");
    }
}

Session::~Session() {
    close();
    if (transit_teardown_.joinable()) {
        transit_teardown_.join();
    }
}

void Session::claim_role(Role role) {
    if (role_ && *role_ != role) {
        throw LogicError(role == Role::SENDER ? "This session is already used for receiving."
                                              : "This session is already used for sending.");
    }
    role_ = role;
}

// Runs one step of an operation. A timeout leaves the state untouched so the
// caller can still close cleanly. A protocol violation closes the session
// before it is raised; any other failure ends the session in ERROR.
template <typename Fn>
auto Session::run_step(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const TimeoutError&) {
        throw;
    } catch (const ProtocolViolation&) {
        close();
        throw;
    } catch (...) {
        if (state_ != SessionState::CLOSED) {
            state_ = SessionState::ERROR;
        }
        throw;
    }
}

// --- Rendezvous ---

std::string Session::generate_code(std::chrono::milliseconds timeout) {
    if (state_ != SessionState::IDLE) {
        throw LogicError("A code can only be generated by an idle session.");
    }
    claim_role(Role::SENDER);

    return run_step([&] {
        std::future<std::string> code = rendezvous_->allocate_code();
        code_ = wait_for_result(code, timeout, "could not connect to the server");
        state_ = SessionState::CODE_READY;
        return code_;
    });
}

void Session::connect(const std::string& code, std::chrono::milliseconds timeout) {
    if (state_ != SessionState::IDLE) {
        throw LogicError("Only an idle session can connect.");
    }
    claim_role(Role::RECEIVER);

    state_ = SessionState::CONNECTING;
    try {
        run_step([&] {
            std::future<void> done = rendezvous_->set_code(code);
            wait_for_result(done, timeout, "could not connect to the other end");
        });
    } catch (const TimeoutError&) {
        state_ = SessionState::IDLE;
        throw;
    }
    code_ = code;
}

Verifier Session::exchange_keys(std::chrono::milliseconds timeout) {
    if (state_ != SessionState::CODE_READY && state_ != SessionState::CONNECTING) {
        throw LogicError("Keys can only be exchanged once the code is set.");
    }

    return run_step([&] {
        std::future<Verifier> verifier = rendezvous_->get_verifier();
        try {
            Verifier result = wait_for_result(verifier, timeout, "could not exchange keys with the other end");
            state_ = SessionState::KEYS_EXCHANGED;
            return result;
        } catch (const WrongSecretError&) {
            throw HumanProtocolError("the other end entered a wrong code");
        }
    });
}

// --- Control messages ---

void Session::send_control(const ControlMessage& message) {
    if (closed_) {
        throw LogicError("The wormhole is closed.");
    }
    rendezvous_->send_message(message.encode());
}

ControlMessage Session::await_control(std::chrono::milliseconds timeout) {
    std::optional<ControlMessage> message = next_control(timeout);
    if (!message) {
        close();
        throw MalformedMessage("bad message came from the other side");
    }
    return std::move(*message);
}

std::optional<ControlMessage> Session::next_control(std::chrono::milliseconds timeout) {
    if (closed_) {
        throw LogicError("The wormhole is closed.");
    }

    if (!pending_message_) {
        pending_message_ = rendezvous_->get_message();
    }
    if (pending_message_->wait_for(timeout) == std::future_status::timeout) {
        throw TimeoutError("no message came from the other side");
    }
    std::future<byte_vector> ready = std::move(*pending_message_);
    pending_message_.reset();

    byte_vector data = ready.get();
    std::optional<ControlMessage> message;
    try {
        message = ControlMessage::try_decode(data);
    } catch (const MalformedMessage&) {
        close();
        throw;
    }

    if (message && message->kind == ControlMessage::Kind::ERROR) {
        fail_with_error_message(message->error);
    }
    return message;
}

void Session::fail_with_error_message(const std::string& text) {
    close();
    throw ProtocolViolation(text);
}

// --- Transit ---

TransitInfo Session::our_transit_info() {
    std::future<nlohmann::json> hints = transit_->get_connection_hints();

    TransitInfo info;
    info.hints = wait_for_result(hints, config_.transit_timeout, "could not reach the transit relay");
    info.abilities = transit_->get_connection_abilities();
    return info;
}

void Session::install_transit_key() {
    byte_vector key = rendezvous_->derive_key(config_.app_id + "/transit-key", transit_->transit_key_length());
    transit_->set_transit_key(key);
}

std::unique_ptr<RecordPipe> Session::connect_transit() {
    std::future<std::unique_ptr<RecordPipe>> pipe = transit_->connect();
    return wait_for_result(pipe, config_.transit_timeout, "could not establish the transit with the other end");
}

// --- Sending ---

std::string Session::send_file(const std::string& path, const ProgressCallback& progress) {
    if (transit_) {
        throw LogicError("A transit is already attached to this session.");
    }
    if (state_ != SessionState::KEYS_EXCHANGED) {
        throw LogicError("Keys must be exchanged before sending a file.");
    }
    claim_role(Role::SENDER);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InvalidArgument(path + " is not a file");
    }
    uint64_t filesize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw InvalidArgument("cannot read " + path + ": " + ec.message());
    }

    state_ = SessionState::TRANSIT_NEGOTIATING;
    return run_step([&] {
        transit_ = transit_factory_(config_.transit_relay, Role::SENDER);
        if (!transit_) {
            throw RuntimeError("could not set up the transit");
        }

        send_control(ControlMessage::make_transit(our_transit_info()));

        FileOffer offer;
        offer.filename = std::filesystem::path(path).filename().string();
        offer.filesize = filesize;
        send_control(ControlMessage::make_offer(offer));
        state_ = SessionState::OFFER_SENT;

        // transit, offer and answer messages can come in any order
        while (true) {
            std::optional<ControlMessage> message = next_control(config_.message_timeout);
            if (!message) {
                continue;
            }

            if (message->kind == ControlMessage::Kind::TRANSIT) {
                transit_->add_connection_hints(message->transit.hints);
                install_transit_key();
            } else if (message->kind == ControlMessage::Kind::ANSWER) {
                if (!message->answer.accepted()) {
                    throw HumanProtocolError("the other side declined the file");
                }

                state_ = SessionState::TRANSFERRING;
                std::unique_ptr<RecordPipe> pipe = connect_transit();
                std::string hex_digest = FileTransfer::send(*pipe, path, progress);
                state_ = SessionState::DONE;
                return hex_digest;
            }
        }
    });
}

// --- Receiving ---

FileOffer Session::await_offer() {
    if (offer_) {
        throw LogicError("An offer is already pending.");
    }
    if (state_ != SessionState::KEYS_EXCHANGED) {
        throw LogicError("Keys must be exchanged before waiting for an offer.");
    }
    claim_role(Role::RECEIVER);

    state_ = SessionState::AWAITING_OFFER;
    return run_step([&] {
        transit_ = transit_factory_(config_.transit_relay, Role::RECEIVER);
        if (!transit_) {
            throw RuntimeError("could not set up the transit");
        }
        install_transit_key();

        // Unlike the sender, this loop expects the transit message to come
        // before the offer.
        while (true) {
            std::optional<ControlMessage> message = next_control(config_.message_timeout);
            if (!message) {
                continue;
            }

            if (message->kind == ControlMessage::Kind::TRANSIT) {
                transit_->add_connection_hints(message->transit.hints);
                send_control(ControlMessage::make_transit(our_transit_info()));
            } else if (message->kind == ControlMessage::Kind::OFFER) {
                offer_ = message->offer;
                state_ = SessionState::OFFER_RECEIVED;
                return *offer_;
            }
        }
    });
}

std::string Session::accept_offer(const std::string& path, const ProgressCallback& progress) {
    if (!offer_ || !transit_) {
        throw LogicError("There is no offer to accept.");
    }
    uint64_t filesize = offer_->filesize;
    offer_.reset();

    state_ = SessionState::ACCEPTING;
    return run_step([&] {
        send_control(ControlMessage::make_answer());

        std::unique_ptr<RecordPipe> pipe = connect_transit();
        state_ = SessionState::TRANSFERRING;
        std::string hex_digest = FileTransfer::receive(*pipe, path, filesize, progress);
        state_ = SessionState::DONE;
        return hex_digest;
    });
}

// --- Closing ---

void Session::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    state_ = SessionState::CLOSED;
    pending_message_.reset();
    offer_.reset();

    // Dropping a transit can wait on its relay connections.
    if (transit_) {
        try {
            transit_teardown_ = std::thread([transit = std::move(transit_)]() mutable { transit.reset(); });
        } catch (const std::system_error& e) {
            std::cerr << "Tearing down the transit in the background failed: " << e.what() << std::endl;
        }
    }

    // Closing the wormhole must never be fatal.
    try {
        std::future<void> done = rendezvous_->close();
        if (done.valid() && done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            done.get();
        }
    } catch (const std::exception& e) {
        std::cerr << "Closing the wormhole failed: " << e.what() << std::endl;
    }
}

} // namespace Wormhole
