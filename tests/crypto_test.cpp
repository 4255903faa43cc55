#include "wormhole/crypto.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wormhole/errors.hpp"

namespace {

Wormhole::byte_vector bytes(const std::string& text) {
    return Wormhole::byte_vector(text.begin(), text.end());
}

}  // namespace

TEST(CryptoTest, HexEncoding) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    Wormhole::byte_vector data = {0x00, 0x7f, 0xab, 0xff};
    ASSERT_EQ(Wormhole::Crypto::to_hex(data), "007fabff");
    ASSERT_EQ(Wormhole::Crypto::from_hex("007fabff"), data);
    ASSERT_EQ(Wormhole::Crypto::from_hex("007FABFF"), data);
    ASSERT_TRUE(Wormhole::Crypto::from_hex("").empty());

    ASSERT_THROW(Wormhole::Crypto::from_hex("abc"), Wormhole::InvalidArgument);
    ASSERT_THROW(Wormhole::Crypto::from_hex("zz"), Wormhole::InvalidArgument);
}

TEST(CryptoTest, Sha256) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    // Known digest of the empty string
    Wormhole::Crypto::Sha256 empty;
    ASSERT_EQ(empty.hex_digest(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    // Incremental updates match a one-shot hash
    Wormhole::Crypto::Sha256 hasher;
    hasher.update(bytes("h"));
    hasher.update(bytes("i!"));
    ASSERT_EQ(hasher.hex_digest(), Wormhole::Crypto::to_hex(Wormhole::Crypto::sha256(bytes("hi!"))));

    // A finalized hasher cannot be reused
    ASSERT_THROW(hasher.update(bytes("more")), Wormhole::LogicError);
}

TEST(CryptoTest, DeriveKey) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    Wormhole::byte_vector key(32, 0x11);

    auto a = Wormhole::Crypto::derive_key(key, "purpose-a", 32);
    auto a_again = Wormhole::Crypto::derive_key(key, "purpose-a", 32);
    auto b = Wormhole::Crypto::derive_key(key, "purpose-b", 32);
    auto other = Wormhole::Crypto::derive_key(Wormhole::byte_vector(32, 0x12), "purpose-a", 32);

    ASSERT_EQ(a.size(), 32u);
    ASSERT_EQ(a, a_again);
    ASSERT_NE(a, b);
    ASSERT_NE(a, other);
    ASSERT_EQ(Wormhole::Crypto::derive_key(key, "purpose-a", 16).size(), 16u);

    ASSERT_THROW(Wormhole::Crypto::derive_key(key, "purpose-a", 0), Wormhole::InvalidArgument);
}

TEST(CryptoTest, SealAndOpen) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    Wormhole::byte_vector key = Wormhole::Crypto::random_bytes(crypto_secretbox_KEYBYTES);
    Wormhole::byte_vector message = bytes(R"({"offer": {}})");

    Wormhole::byte_vector box = Wormhole::Crypto::seal(message, key);
    ASSERT_EQ(Wormhole::Crypto::open(box, key), message);

    // Every seal uses a fresh nonce
    ASSERT_NE(Wormhole::Crypto::seal(message, key), box);

    // A different key or a flipped bit is rejected
    Wormhole::byte_vector wrong_key = Wormhole::Crypto::random_bytes(crypto_secretbox_KEYBYTES);
    ASSERT_THROW(Wormhole::Crypto::open(box, wrong_key), Wormhole::RuntimeError);
    box.back() ^= 0x01;
    ASSERT_THROW(Wormhole::Crypto::open(box, key), Wormhole::RuntimeError);
    ASSERT_THROW(Wormhole::Crypto::open(Wormhole::byte_vector(4), key), Wormhole::RuntimeError);
    ASSERT_THROW(Wormhole::Crypto::seal(message, Wormhole::byte_vector(5)), Wormhole::InvalidArgument);
}

TEST(CryptoTest, RecordEncryptDecrypt) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    Wormhole::byte_vector key = Wormhole::Crypto::random_bytes(crypto_aead_chacha20poly1305_ietf_KEYBYTES);
    Wormhole::byte_vector chunk = bytes("file contents");

    Wormhole::byte_vector record = Wormhole::Crypto::encrypt_record(chunk, 7, key);
    Wormhole::Crypto::DecryptedRecord decrypted = Wormhole::Crypto::decrypt_record(record, key);

    ASSERT_EQ(decrypted.data, chunk);
    ASSERT_EQ(decrypted.counter, 7u);
}

TEST(CryptoTest, RecordTamperingDetected) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);
    Wormhole::byte_vector key = Wormhole::Crypto::random_bytes(crypto_aead_chacha20poly1305_ietf_KEYBYTES);
    Wormhole::byte_vector record = Wormhole::Crypto::encrypt_record(bytes("chunk"), 1, key);

    // The counter is authenticated
    Wormhole::byte_vector replayed = record;
    replayed[crypto_aead_chacha20poly1305_ietf_NPUBBYTES + 7] ^= 0x01;
    ASSERT_THROW(Wormhole::Crypto::decrypt_record(replayed, key), Wormhole::RuntimeError);

    Wormhole::byte_vector corrupted = record;
    corrupted.back() ^= 0x80;
    ASSERT_THROW(Wormhole::Crypto::decrypt_record(corrupted, key), Wormhole::RuntimeError);

    Wormhole::byte_vector other_key = Wormhole::Crypto::random_bytes(crypto_aead_chacha20poly1305_ietf_KEYBYTES);
    ASSERT_THROW(Wormhole::Crypto::decrypt_record(record, other_key), Wormhole::RuntimeError);
    ASSERT_THROW(Wormhole::Crypto::decrypt_record(Wormhole::byte_vector(10), key), Wormhole::RuntimeError);
}
