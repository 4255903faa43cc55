#ifndef WORMHOLE_SESSION_HPP
#define WORMHOLE_SESSION_HPP

#include "config.hpp"
#include "control_message.hpp"
#include "file_transfer.hpp"
#include "rendezvous.hpp"
#include "transit.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace Wormhole {

    enum class SessionState {
        IDLE,
        CODE_READY,
        CONNECTING,
        KEYS_EXCHANGED,
        TRANSIT_NEGOTIATING,
        OFFER_SENT,
        AWAITING_OFFER,
        OFFER_RECEIVED,
        ACCEPTING,
        TRANSFERRING,
        DONE,
        ERROR,
        CLOSED
    };

    const char* to_string(SessionState state);

    /**
     * @brief Drives a single file transfer between two ends of a wormhole.
     *
     * Usage for sending files:
     *
     *     std::string code = session.generate_code();
     *     Verifier verifier = session.exchange_keys();
     *     std::string hex_digest = session.send_file(path);
     *
     * Usage for receiving files:
     *
     *     session.connect(code);
     *     Verifier verifier = session.exchange_keys();
     *     FileOffer offer = session.await_offer();
     *     std::string hex_digest = session.accept_offer(path);
     *
     * Every operation blocks the calling thread until its result is in or its
     * timeout expires. Sessions share no state, so independent sessions can be
     * driven from separate threads. A session is single-use: after a failure,
     * close it and start a new one.
     */
    class Session {
    public:
        /**
         * @param config App id, transit relay and default timeouts.
         * @param rendezvous The signalling channel; owned by the session.
         * @param transit_factory Builds a fresh transit channel per transfer.
         */
        Session(Config config, std::unique_ptr<RendezvousClient> rendezvous, TransitFactory transit_factory);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @brief [SENDER] Asks the server for a code to pass to the other human.
         * @return The code, e.g. "7-guitarist-revenue".
         * @throws TimeoutError("could not connect to the server") on expiry.
         * @throws LogicError if the session is not idle.
         */
        std::string generate_code(std::chrono::milliseconds timeout = std::chrono::seconds(10));

        /**
         * @brief [RECEIVER] Connects to the other end using the code it generated.
         * @throws TimeoutError("could not connect to the other end") on expiry.
         * @throws LogicError if the session is not idle.
         */
        void connect(const std::string& code, std::chrono::milliseconds timeout = std::chrono::seconds(10));

        /**
         * @brief Waits for the key exchange to complete.
         * @return The verifier, for the humans to compare out of band.
         * @throws HumanProtocolError if the other end entered a wrong code.
         * @throws TimeoutError on expiry.
         */
        Verifier exchange_keys(std::chrono::milliseconds timeout = std::chrono::seconds(10));

        /**
         * @brief Sends a control message without waiting for any acknowledgement.
         */
        void send_control(const ControlMessage& message);

        /**
         * @brief Waits for the next control message from the other end.
         *
         * An error message closes the session and is raised as a
         * ProtocolViolation carrying its text.
         * @throws MalformedMessage if the message cannot be decoded.
         * @throws TimeoutError("no message came from the other side") on expiry.
         */
        ControlMessage await_control(std::chrono::milliseconds timeout = std::chrono::seconds(600));

        /**
         * @brief [SENDER] Negotiates the transit, offers the file and streams it
         * once the other end accepts.
         * @return The hex SHA-256 digest of the file.
         * @throws InvalidArgument if path is not a regular file.
         * @throws LogicError if a transit is already attached.
         * @throws HumanProtocolError if the other side declined the file.
         */
        std::string send_file(const std::string& path, const ProgressCallback& progress = nullptr);

        /**
         * @brief [RECEIVER] Negotiates the transit and waits for a file offer.
         * @throws LogicError if an offer is already pending.
         */
        FileOffer await_offer();

        /**
         * @brief [RECEIVER] Accepts the pending offer and writes the file to path.
         * @return The hex SHA-256 digest of the received file.
         * @throws LogicError if no offer is pending or no transit is attached.
         * @throws TransferIncomplete if the stream ends early.
         * @throws ProtocolViolation if more than the offered size arrives; the
         * session is closed first.
         */
        std::string accept_offer(const std::string& path, const ProgressCallback& progress = nullptr);

        /**
         * @brief Closes the wormhole. Safe to call any number of times, from any
         * state; never throws and never waits for the server.
         *
         * An attached transit is torn down on a background thread, which the
         * destructor joins.
         */
        void close() noexcept;

        SessionState state() const { return state_; }
        std::optional<Role> role() const { return role_; }
        const std::string& code() const { return code_; }
        const std::optional<FileOffer>& pending_offer() const { return offer_; }
        const Config& config() const { return config_; }

    private:
        template <typename Fn>
        auto run_step(Fn&& fn) -> decltype(fn());

        std::optional<ControlMessage> next_control(std::chrono::milliseconds timeout);
        [[noreturn]] void fail_with_error_message(const std::string& text);
        TransitInfo our_transit_info();
        void install_transit_key();
        void claim_role(Role role);
        std::unique_ptr<RecordPipe> connect_transit();

        Config config_;
        std::unique_ptr<RendezvousClient> rendezvous_;
        TransitFactory transit_factory_;
        std::unique_ptr<TransitChannel> transit_;

        SessionState state_ = SessionState::IDLE;
        std::optional<Role> role_;
        std::string code_;
        std::optional<FileOffer> offer_;

        // A receive that outlived its caller's timeout; the next call picks it up.
        std::optional<std::future<byte_vector>> pending_message_;
        bool closed_ = false;
        std::thread transit_teardown_;
    };

} // namespace Wormhole

#endif // WORMHOLE_SESSION_HPP
