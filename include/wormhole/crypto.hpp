#ifndef WORMHOLE_CRYPTO_HPP
#define WORMHOLE_CRYPTO_HPP

#include "record.hpp"

#include <sodium.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace Wormhole {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        static byte_vector random_bytes(size_t length);

        static std::string to_hex(const byte_vector& data);

        /**
         * @brief Decodes a hex string.
         * @throws InvalidArgument if the string is not valid hex.
         */
        static byte_vector from_hex(const std::string& hex);

        /**
         * @brief Incremental SHA-256, used for the content digest of transferred files.
         */
        class Sha256 {
        public:
            Sha256();

            void update(const uint8_t* data, size_t length);
            void update(const byte_vector& data);

            /**
             * @brief Finalizes the hash. The object must not be updated afterwards.
             * @return 64 lowercase hex characters.
             */
            std::string hex_digest();

        private:
            crypto_hash_sha256_state state_;
            bool finalized_ = false;
        };

        static byte_vector sha256(const byte_vector& data);

        /**
         * @brief HKDF-SHA256 with an empty salt.
         * @param key The input keying material.
         * @param purpose Context string, e.g. "<app_id>/transit-key".
         * @param length Number of bytes to derive.
         */
        static byte_vector derive_key(const byte_vector& key, const std::string& purpose, size_t length);

        /**
         * @brief Encrypts a message with XSalsa20-Poly1305 (crypto_secretbox).
         * @return nonce || ciphertext.
         */
        static byte_vector seal(const byte_vector& plaintext, const byte_vector& key);

        /**
         * @brief Reverses seal().
         * @throws RuntimeError if the box does not authenticate under the key.
         */
        static byte_vector open(const byte_vector& box, const byte_vector& key);

        /**
         * @brief A decrypted transit record together with its counter.
         */
        struct DecryptedRecord {
            byte_vector data;
            uint64_t counter;
        };

        /**
         * @brief Encrypts a transit record using ChaCha20-Poly1305.
         * Format: [Nonce (12)] + [Counter (8, big-endian, authenticated)] + [Ciphertext + Tag].
         * @param plaintext The record contents.
         * @param counter The record counter.
         * @param key The symmetric encryption key.
         */
        static byte_vector encrypt_record(const byte_vector& plaintext, uint64_t counter, const byte_vector& key);

        /**
         * @brief Decrypts a transit record.
         * @throws RuntimeError if decryption fails.
         */
        static DecryptedRecord decrypt_record(const byte_vector& record, const byte_vector& key);
    };

} // namespace Wormhole

#endif // WORMHOLE_CRYPTO_HPP
