#include "wormhole/spake2.hpp"

#include <sodium.h>

#include <algorithm>
#include <utility>

#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

namespace Wormhole {

namespace {

constexpr char BLINDING_SEED[] = "wormhole SPAKE2 symmetric S";

// S = hash_to_curve(BLINDING_SEED). Nobody knows its discrete log.
byte_vector blinding_point() {
    byte_vector seed(BLINDING_SEED, BLINDING_SEED + sizeof(BLINDING_SEED) - 1);
    byte_vector uniform = Crypto::sha256(seed);
    byte_vector point(crypto_core_ed25519_BYTES);
    if (crypto_core_ed25519_from_uniform(point.data(), uniform.data()) != 0) {
        throw RuntimeError("Failed to compute the SPAKE2 blinding point.");
    }
    return point;
}

byte_vector password_to_scalar(const std::string& id, const std::string& password) {
    crypto_hash_sha512_state state;
    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, reinterpret_cast<const unsigned char*>(id.data()), id.size());
    crypto_hash_sha512_update(&state, reinterpret_cast<const unsigned char*>(password.data()), password.size());

    byte_vector wide(crypto_hash_sha512_BYTES);
    crypto_hash_sha512_final(&state, wide.data());

    byte_vector scalar(crypto_core_ed25519_SCALARBYTES);
    crypto_core_ed25519_scalar_reduce(scalar.data(), wide.data());
    sodium_memzero(wide.data(), wide.size());
    return scalar;
}

byte_vector blinded(const byte_vector& password_scalar) {
    byte_vector out(crypto_core_ed25519_BYTES);
    byte_vector s = blinding_point();
    if (crypto_scalarmult_ed25519_noclamp(out.data(), password_scalar.data(), s.data()) != 0) {
        throw RuntimeError("Failed to blind the SPAKE2 element.");
    }
    return out;
}

} // namespace

Spake2::Spake2(std::string password, std::string id_symmetric)
    : password_(std::move(password)), id_(std::move(id_symmetric)) {}

Spake2::~Spake2() {
    if (!scalar_.empty()) {
        sodium_memzero(scalar_.data(), scalar_.size());
    }
    if (!password_scalar_.empty()) {
        sodium_memzero(password_scalar_.data(), password_scalar_.size());
    }
}

byte_vector Spake2::start() {
    if (!outbound_.empty()) {
        throw LogicError("SPAKE2 exchange has already been started.");
    }

    scalar_.resize(crypto_core_ed25519_SCALARBYTES);
    crypto_core_ed25519_scalar_random(scalar_.data());
    password_scalar_ = password_to_scalar(id_, password_);

    // T = x*B + w*S
    byte_vector x_b(crypto_core_ed25519_BYTES);
    if (crypto_scalarmult_ed25519_base_noclamp(x_b.data(), scalar_.data()) != 0) {
        throw RuntimeError("Failed to compute the SPAKE2 element.");
    }
    byte_vector w_s = blinded(password_scalar_);

    outbound_.resize(crypto_core_ed25519_BYTES);
    crypto_core_ed25519_add(outbound_.data(), x_b.data(), w_s.data());
    return outbound_;
}

byte_vector Spake2::finish(const byte_vector& inbound) {
    if (outbound_.empty()) {
        throw LogicError("start must be called before finish.");
    }
    if (inbound.size() != crypto_core_ed25519_BYTES ||
        crypto_core_ed25519_is_valid_point(inbound.data()) != 1) {
        throw InvalidArgument("Invalid SPAKE2 element from the other end.");
    }

    // K = x*(T' - w*S)
    byte_vector w_s = blinded(password_scalar_);
    byte_vector unblinded(crypto_core_ed25519_BYTES);
    crypto_core_ed25519_sub(unblinded.data(), inbound.data(), w_s.data());

    byte_vector shared(crypto_core_ed25519_BYTES);
    if (crypto_scalarmult_ed25519_noclamp(shared.data(), scalar_.data(), unblinded.data()) != 0) {
        throw InvalidArgument("Invalid SPAKE2 element from the other end.");
    }

    // The transcript is ordered so both ends hash the same bytes.
    const byte_vector& first = std::min(outbound_, inbound);
    const byte_vector& second = std::max(outbound_, inbound);

    byte_vector transcript;
    byte_vector password_hash = Crypto::sha256(byte_vector(password_.begin(), password_.end()));
    byte_vector id_hash = Crypto::sha256(byte_vector(id_.begin(), id_.end()));
    transcript.insert(transcript.end(), password_hash.begin(), password_hash.end());
    transcript.insert(transcript.end(), id_hash.begin(), id_hash.end());
    transcript.insert(transcript.end(), first.begin(), first.end());
    transcript.insert(transcript.end(), second.begin(), second.end());
    transcript.insert(transcript.end(), shared.begin(), shared.end());

    byte_vector key = Crypto::sha256(transcript);
    sodium_memzero(shared.data(), shared.size());
    sodium_memzero(transcript.data(), transcript.size());
    return key;
}

} // namespace Wormhole
