// ==============================================================================
// BIP340 Schnorr Signatures - Implementation
// ==============================================================================
// Key derivation, signing and verification go through libsecp256k1's
// extrakeys and schnorrsig modules, sharing one lazily created context.
// Random key material comes from OpenSSL.
// ==============================================================================

#include "schnorr.hpp"
#include "hash.hpp"
#include "error.hpp"
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
#include <openssl/rand.h>
#include <memory>

namespace sil {

namespace {

// ==============================================================================
// Context
// ==============================================================================

struct ContextDeleter {
    void operator()(secp256k1_context* p) const { secp256k1_context_destroy(p); }
};

using ContextPtr = std::unique_ptr<secp256k1_context, ContextDeleter>;

/**
 * @brief Process-wide signing and verification context
 */
const secp256k1_context* context() {
    static ContextPtr ctx(
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY));
    if (!ctx) {
        throw InternalError("could not create secp256k1 context");
    }
    return ctx.get();
}

/**
 * @brief Build a key pair, rejecting keys that are not 32 bytes or not in [1, n-1]
 */
secp256k1_keypair make_keypair(const Bytes& secret_key) {
    if (secret_key.size() != SECRET_KEY_SIZE) {
        throw InputError(build_error_message(
            "secret key must be 32 bytes, got ", secret_key.size()));
    }
    secp256k1_keypair keypair;
    if (secp256k1_keypair_create(context(), &keypair, secret_key.data()) != 1) {
        throw InputError("secret key is outside the valid range [1, n-1]");
    }
    return keypair;
}

}  // namespace

// ==============================================================================
// Public API
// ==============================================================================

bool is_valid_secret_key(const Bytes& secret_key) {
    return secret_key.size() == SECRET_KEY_SIZE &&
           secp256k1_ec_seckey_verify(context(), secret_key.data()) == 1;
}

Bytes schnorr_public_key(const Bytes& secret_key) {
    secp256k1_keypair keypair = make_keypair(secret_key);

    secp256k1_xonly_pubkey xonly;
    if (secp256k1_keypair_xonly_pub(context(), &xonly, nullptr, &keypair) != 1) {
        throw InternalError("could not derive x-only public key");
    }
    Bytes out(XONLY_PUBKEY_SIZE);
    if (secp256k1_xonly_pubkey_serialize(context(), out.data(), &xonly) != 1) {
        throw InternalError("could not serialize x-only public key");
    }
    return out;
}

Bytes schnorr_sign(const Bytes& message, const Bytes& secret_key, const Bytes& aux_rand) {
    if (message.size() != HASH_SIZE) {
        throw InputError(build_error_message(
            "message to sign must be 32 bytes, got ", message.size()));
    }
    if (aux_rand.size() != 32) {
        throw InputError("auxiliary randomness must be 32 bytes");
    }

    secp256k1_keypair keypair = make_keypair(secret_key);
    Bytes signature(SCHNORR_SIGNATURE_SIZE);
    if (secp256k1_schnorrsig_sign32(context(), signature.data(), message.data(), &keypair,
                                    aux_rand.data()) != 1) {
        throw InternalError("Schnorr signing failed");
    }
    return signature;
}

bool schnorr_verify(const Bytes& signature, const Bytes& message, const Bytes& public_key) {
    if (signature.size() != SCHNORR_SIGNATURE_SIZE || public_key.size() != XONLY_PUBKEY_SIZE ||
        message.size() != HASH_SIZE) {
        return false;
    }

    secp256k1_xonly_pubkey xonly;
    if (secp256k1_xonly_pubkey_parse(context(), &xonly, public_key.data()) != 1) {
        return false;
    }
    return secp256k1_schnorrsig_verify(context(), signature.data(), message.data(),
                                       message.size(), &xonly) == 1;
}

KeyPair generate_keypair() {
    KeyPair pair;
    pair.secret_key.resize(SECRET_KEY_SIZE);

    // Retry on the (astronomically unlikely) out-of-range draw
    do {
        if (RAND_bytes(pair.secret_key.data(), static_cast<int>(pair.secret_key.size())) != 1) {
            throw InternalError("system random source failed");
        }
    } while (!is_valid_secret_key(pair.secret_key));

    pair.public_key = schnorr_public_key(pair.secret_key);
    return pair;
}

}  // namespace sil
