#ifndef WORMHOLE_SPAKE2_HPP
#define WORMHOLE_SPAKE2_HPP

#include "record.hpp"

#include <string>

namespace Wormhole {

    /**
     * @brief Symmetric SPAKE2 over the ed25519 group.
     *
     * Both ends run the same steps with the same code: start() produces the
     * element to send, finish() combines the element received from the other
     * end into a 32-byte shared key. Two ends that used different codes end
     * up with unrelated keys; nothing in the exchange itself reveals that, so
     * callers confirm the key with a message encrypted under it.
     */
    class Spake2 {
    public:
        static constexpr size_t KEY_BYTES = 32;

        /**
         * @param password The wormhole code.
         * @param id_symmetric Identity shared by both ends, e.g. the application id.
         */
        Spake2(std::string password, std::string id_symmetric);
        ~Spake2();

        Spake2(const Spake2&) = delete;
        Spake2& operator=(const Spake2&) = delete;

        /**
         * @brief Generates our secret scalar and the outbound element.
         * @throws LogicError if called twice.
         */
        byte_vector start();

        /**
         * @brief Computes the shared key from the other end's element.
         * @throws InvalidArgument if the element is not a valid group element.
         * @throws LogicError if start() has not been called.
         */
        byte_vector finish(const byte_vector& inbound);

    private:
        std::string password_;
        std::string id_;
        byte_vector scalar_;
        byte_vector password_scalar_;
        byte_vector outbound_;
    };

} // namespace Wormhole

#endif // WORMHOLE_SPAKE2_HPP
