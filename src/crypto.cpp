#include "wormhole/crypto.hpp"

#include <arpa/inet.h>  // For htonl, ntohl

#include <algorithm>
#include <atomic>

#include "wormhole/errors.hpp"

// Helper for 64-bit network byte order conversion
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
static uint64_t htonll_local(uint64_t val) {
    return (((uint64_t) htonl(val)) << 32) + htonl(val >> 32);
}
static uint64_t ntohll_local(uint64_t val) {
    return (((uint64_t) ntohl(val)) << 32) + ntohl(val >> 32);
}
#else
#define htonll_local(x) (x)
#define ntohll_local(x) (x)
#endif

namespace Wormhole {

    static std::atomic<bool> g_sodium_initialized = false;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    byte_vector Crypto::random_bytes(size_t length) {
        byte_vector out(length);
        randombytes_buf(out.data(), out.size());
        return out;
    }

    std::string Crypto::to_hex(const byte_vector& data) {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.pop_back();  // Drop the terminator written by sodium
        return hex;
    }

    byte_vector Crypto::from_hex(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw InvalidArgument("Hex string has an odd length.");
        }
        byte_vector out(hex.size() / 2);
        size_t out_len = 0;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &out_len, nullptr) != 0 ||
            out_len != out.size()) {
            throw InvalidArgument("Invalid hex string.");
        }
        return out;
    }

    // --- Sha256 ---

    Crypto::Sha256::Sha256() {
        crypto_hash_sha256_init(&state_);
    }

    void Crypto::Sha256::update(const uint8_t* data, size_t length) {
        if (finalized_) {
            throw LogicError("Digest has already been finalized.");
        }
        crypto_hash_sha256_update(&state_, data, length);
    }

    void Crypto::Sha256::update(const byte_vector& data) {
        update(data.data(), data.size());
    }

    std::string Crypto::Sha256::hex_digest() {
        if (finalized_) {
            throw LogicError("Digest has already been finalized.");
        }
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256_final(&state_, digest.data());
        finalized_ = true;
        return to_hex(digest);
    }

    byte_vector Crypto::sha256(const byte_vector& data) {
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), data.data(), data.size());
        return digest;
    }

    byte_vector Crypto::derive_key(const byte_vector& key, const std::string& purpose, size_t length) {
        if (length == 0 || length > crypto_kdf_hkdf_sha256_BYTES_MAX) {
            throw InvalidArgument("Invalid length for key derivation.");
        }

        byte_vector prk(crypto_kdf_hkdf_sha256_KEYBYTES);
        crypto_kdf_hkdf_sha256_extract(prk.data(), nullptr, 0, key.data(), key.size());

        byte_vector out(length);
        if (crypto_kdf_hkdf_sha256_expand(out.data(), out.size(), purpose.data(), purpose.size(), prk.data()) != 0) {
            sodium_memzero(prk.data(), prk.size());
            throw RuntimeError("Failed to derive key.");
        }
        sodium_memzero(prk.data(), prk.size());
        return out;
    }

    // --- Secretbox (mailbox messages) ---

    byte_vector Crypto::seal(const byte_vector& plaintext, const byte_vector& key) {
        if (key.size() != crypto_secretbox_KEYBYTES) {
            throw InvalidArgument("Invalid key size for sealing.");
        }

        byte_vector box(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + plaintext.size());
        randombytes_buf(box.data(), crypto_secretbox_NONCEBYTES);
        crypto_secretbox_easy(box.data() + crypto_secretbox_NONCEBYTES,
                              plaintext.data(),
                              plaintext.size(),
                              box.data(),
                              key.data());
        return box;
    }

    byte_vector Crypto::open(const byte_vector& box, const byte_vector& key) {
        if (key.size() != crypto_secretbox_KEYBYTES) {
            throw InvalidArgument("Invalid key size for opening.");
        }
        if (box.size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
            throw RuntimeError("Box too small to be valid.");
        }

        const unsigned char* ciphertext = box.data() + crypto_secretbox_NONCEBYTES;
        size_t ciphertext_len = box.size() - crypto_secretbox_NONCEBYTES;

        byte_vector plaintext(ciphertext_len - crypto_secretbox_MACBYTES);
        if (crypto_secretbox_open_easy(plaintext.data(), ciphertext, ciphertext_len, box.data(), key.data()) != 0) {
            throw RuntimeError("Failed to open box. Authentication tag may be invalid.");
        }
        return plaintext;
    }

    // --- Transit records ---

    byte_vector Crypto::encrypt_record(const byte_vector& plaintext, uint64_t counter, const byte_vector& key) {
        if (key.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for encryption.");
        }

        byte_vector nonce(crypto_aead_chacha20poly1305_ietf_NPUBBYTES);
        randombytes_buf(nonce.data(), nonce.size());

        uint64_t be_counter = htonll_local(counter);

        byte_vector record;
        // Size: Nonce + Counter + Ciphertext + Auth Tag
        record.resize(nonce.size() + sizeof(be_counter) + plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

        unsigned long long ciphertext_len;
        crypto_aead_chacha20poly1305_ietf_encrypt(record.data() + nonce.size() + sizeof(be_counter),
                                                  &ciphertext_len,
                                                  plaintext.data(),
                                                  plaintext.size(),
                                                  reinterpret_cast<unsigned char*>(&be_counter),
                                                  sizeof(be_counter),
                                                  nullptr,  // nsec is not used
                                                  nonce.data(),
                                                  key.data());

        std::copy(nonce.begin(), nonce.end(), record.begin());
        std::copy(reinterpret_cast<uint8_t*>(&be_counter),
                  reinterpret_cast<uint8_t*>(&be_counter) + sizeof(be_counter),
                  record.begin() + nonce.size());

        return record;
    }

    Crypto::DecryptedRecord Crypto::decrypt_record(const byte_vector& record, const byte_vector& key) {
        if (key.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for decryption.");
        }

        constexpr size_t NONCE_SIZE = crypto_aead_chacha20poly1305_ietf_NPUBBYTES;
        constexpr size_t COUNTER_SIZE = sizeof(uint64_t);
        constexpr size_t HEADER_SIZE = NONCE_SIZE + COUNTER_SIZE;

        if (record.size() < HEADER_SIZE + crypto_aead_chacha20poly1305_ietf_ABYTES) {
            throw RuntimeError("Record too small to be valid.");
        }

        uint64_t be_counter;
        std::copy(record.begin() + NONCE_SIZE, record.begin() + HEADER_SIZE, reinterpret_cast<uint8_t*>(&be_counter));

        const unsigned char* ciphertext_with_tag = record.data() + HEADER_SIZE;
        size_t ciphertext_with_tag_len = record.size() - HEADER_SIZE;

        DecryptedRecord result;
        result.data.resize(ciphertext_with_tag_len - crypto_aead_chacha20poly1305_ietf_ABYTES);
        unsigned long long decrypted_len;

        if (crypto_aead_chacha20poly1305_ietf_decrypt(result.data.data(),
                                                      &decrypted_len,
                                                      nullptr,  // nsec is not used
                                                      ciphertext_with_tag,
                                                      ciphertext_with_tag_len,
                                                      reinterpret_cast<const unsigned char*>(&be_counter),
                                                      sizeof(be_counter),
                                                      record.data(),
                                                      key.data()) != 0) {
            throw RuntimeError("Failed to decrypt record. Authentication tag may be invalid.");
        }

        result.data.resize(decrypted_len);
        result.counter = ntohll_local(be_counter);
        return result;
    }

}  // namespace Wormhole
