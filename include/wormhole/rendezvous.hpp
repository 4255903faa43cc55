#ifndef WORMHOLE_RENDEZVOUS_HPP
#define WORMHOLE_RENDEZVOUS_HPP

#include "record.hpp"

#include <future>
#include <string>

namespace Wormhole {

    /**
     * @brief Signalling channel to the other end via a rendezvous (mailbox) server.
     *
     * Implementations own the network connection and the key agreement. All
     * methods returning futures must not block; a future may stay unresolved
     * forever, callers bound their waits.
     */
    class RendezvousClient {
    public:
        virtual ~RendezvousClient() = default;

        /**
         * @brief Asks the server for a fresh code.
         * @return A future resolving into the code, e.g. "7-guitarist-revenue".
         */
        virtual std::future<std::string> allocate_code() = 0;

        /**
         * @brief Uses a code generated at the other end.
         * @return A future resolving once the rendezvous with the other end succeeded.
         */
        virtual std::future<void> set_code(const std::string& code) = 0;

        /**
         * @brief Derives a per-purpose key from the shared secret.
         * @throws LogicError if the key exchange has not completed yet.
         */
        virtual byte_vector derive_key(const std::string& purpose, size_t length) = 0;

        /**
         * @brief Resolves into the verifier once the key exchange completed.
         * Rejects with WrongSecretError if the two ends used different codes.
         */
        virtual std::future<Verifier> get_verifier() = 0;

        /**
         * @brief Sends a message to the other end. Messages are delivered in order.
         */
        virtual void send_message(const byte_vector& message) = 0;

        /**
         * @brief Resolves into the next message from the other end.
         */
        virtual std::future<byte_vector> get_message() = 0;

        virtual std::future<void> close() = 0;
    };

} // namespace Wormhole

#endif // WORMHOLE_RENDEZVOUS_HPP
