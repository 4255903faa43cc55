#ifndef WORMHOLE_RECORD_HPP
#define WORMHOLE_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Wormhole {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // A hash of the shared key that the two humans can compare out of band.
    using Verifier = byte_vector;

    /**
     * @brief The final record a receiver sends back over the transit once the
     * file contents are in.
     * Format: {"ack": "ok", "sha256": "<64 lowercase hex chars>"}
     */
    struct AckRecord {
        std::string ack;
        std::optional<std::string> sha256;

        bool is_ok() const { return ack == "ok"; }

        byte_vector encode() const;

        /**
         * @brief Parses an ack record.
         * @throws Wormhole::MalformedMessage if the data is not a JSON object with a string "ack".
         */
        static AckRecord decode(const byte_vector& data);
    };

} // namespace Wormhole

#endif // WORMHOLE_RECORD_HPP
