#ifndef WORMHOLE_CONTROL_MESSAGE_HPP
#define WORMHOLE_CONTROL_MESSAGE_HPP

#include "record.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace Wormhole {

    // Transit details exchanged so the two ends can open a data channel.
    struct TransitInfo {
        nlohmann::json abilities = nlohmann::json::array();  // "abilities-v1"
        nlohmann::json hints = nlohmann::json::array();      // "hints-v1"

        bool operator==(const TransitInfo& other) const {
            return abilities == other.abilities && hints == other.hints;
        }
    };

    // A file the sender proposes to transfer. The filename comes from the
    // other end and must not be used as a local path as is.
    struct FileOffer {
        std::string filename;
        uint64_t filesize = 0;

        bool operator==(const FileOffer& other) const {
            return filename == other.filename && filesize == other.filesize;
        }
    };

    // The receiver's response to an offer. The body is kept as sent so that a
    // malformed answer can still be told apart from a missing one.
    struct Answer {
        nlohmann::json body = nlohmann::json::object();

        /**
         * @brief True only for {"file_ack": "ok"}.
         */
        bool accepted() const;

        bool operator==(const Answer& other) const { return body == other.body; }
    };

    /**
     * @brief A JSON message exchanged through the rendezvous client.
     *
     * Exactly one of the recognized keys is present on the wire:
     *   {"transit": {"abilities-v1": [...], "hints-v1": [...]}}
     *   {"offer": {"file": {"filename": "<basename>", "filesize": <uint>}}}
     *   {"answer": {"file_ack": "ok"}}
     *   {"error": "<human-readable string>"}
     */
    struct ControlMessage {
        enum class Kind {
            TRANSIT,
            OFFER,
            ANSWER,
            ERROR
        };

        Kind kind = Kind::ERROR;
        TransitInfo transit;
        FileOffer offer;
        Answer answer;
        std::string error;

        static ControlMessage make_transit(TransitInfo info);
        static ControlMessage make_offer(FileOffer offer);
        static ControlMessage make_answer(const std::string& file_ack = "ok");
        static ControlMessage make_error(std::string message);

        /**
         * @brief Serializes the message to canonical (sorted-key) JSON bytes.
         */
        byte_vector encode() const;

        /**
         * @brief Parses a message.
         * @throws MalformedMessage if the data is not JSON, not an object, does
         * not carry exactly one recognized key, or the key's value has the
         * wrong shape.
         */
        static ControlMessage decode(const byte_vector& data);

        /**
         * @brief Like decode(), but returns std::nullopt for a JSON object that
         * carries none of the recognized keys.
         */
        static std::optional<ControlMessage> try_decode(const byte_vector& data);

        bool operator==(const ControlMessage& other) const;
    };

} // namespace Wormhole

#endif // WORMHOLE_CONTROL_MESSAGE_HPP
