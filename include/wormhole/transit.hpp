#ifndef WORMHOLE_TRANSIT_HPP
#define WORMHOLE_TRANSIT_HPP

#include "record.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace Wormhole {

    enum class Role {
        SENDER,
        RECEIVER
    };

    /**
     * @brief A reliable, ordered, encrypted pipe of length-framed records.
     */
    class RecordPipe {
    public:
        virtual ~RecordPipe() = default;

        virtual void send_record(const byte_vector& record) = 0;

        /**
         * @brief Blocks until the next record arrives.
         * @return The record, or std::nullopt once the other end closed the pipe.
         */
        virtual std::optional<byte_vector> receive_record() = 0;

        virtual void close() = 0;
    };

    /**
     * @brief Establishes the data channel for the file contents, either
     * directly or through a transit relay.
     */
    class TransitChannel {
    public:
        virtual ~TransitChannel() = default;

        /**
         * @brief Resolves into our connection hints (a JSON array) for the other end.
         */
        virtual std::future<nlohmann::json> get_connection_hints() = 0;

        virtual nlohmann::json get_connection_abilities() const = 0;

        virtual void add_connection_hints(const nlohmann::json& hints) = 0;

        virtual size_t transit_key_length() const = 0;

        virtual void set_transit_key(const byte_vector& key) = 0;

        /**
         * @brief Connects to the other end.
         * @return A future resolving into the pipe once the other end joined.
         */
        virtual std::future<std::unique_ptr<RecordPipe>> connect() = 0;
    };

    // Builds a fresh transit channel bound to a relay address.
    using TransitFactory = std::function<std::unique_ptr<TransitChannel>(const std::string& transit_relay, Role role)>;

} // namespace Wormhole

#endif // WORMHOLE_TRANSIT_HPP
