#ifndef WORMHOLE_MAILBOX_MESSAGES_HPP
#define WORMHOLE_MAILBOX_MESSAGES_HPP

#include "record.hpp"

#include <string>

namespace Wormhole {

    /**
     * @brief A JSON text frame between a rendezvous client and the mailbox server.
     *
     * Client to server: bind {app_id, side}, allocate, claim {nameplate},
     *                   add {phase, body}, close.
     * Server to client: allocated {nameplate}, claimed {nameplate},
     *                   message {side, phase, body}, closed, error {error}.
     *
     * Bodies are opaque to the server and travel hex-encoded.
     */
    struct MailboxFrame {
        std::string type;
        std::string app_id;
        std::string side;
        std::string nameplate;
        std::string phase;
        byte_vector body;
        std::string error;

        static MailboxFrame bind(const std::string& app_id, const std::string& side);
        static MailboxFrame allocate();
        static MailboxFrame claim(const std::string& nameplate);
        static MailboxFrame add(const std::string& phase, const byte_vector& body);
        static MailboxFrame close();

        std::string serialize() const;

        /**
         * @throws MalformedMessage if the text is not a JSON object with a string "type".
         */
        static MailboxFrame deserialize(const std::string& text);
    };

} // namespace Wormhole

#endif // WORMHOLE_MAILBOX_MESSAGES_HPP
