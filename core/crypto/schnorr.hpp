// ==============================================================================
// BIP340 Schnorr Signatures
// ==============================================================================
// Signing and verification over secp256k1 with x-only public keys.
// Used by OP_CHECKSIG in the script engine and by argument auto-signing.
// ==============================================================================

#ifndef SILVERSCRIPT_CRYPTO_SCHNORR_HPP
#define SILVERSCRIPT_CRYPTO_SCHNORR_HPP

#include "types.hpp"

namespace sil {

constexpr size_t SECRET_KEY_SIZE = 32;
constexpr size_t XONLY_PUBKEY_SIZE = 32;
constexpr size_t SCHNORR_SIGNATURE_SIZE = 64;

struct KeyPair {
    Bytes secret_key;   // 32 bytes
    Bytes public_key;   // 32-byte x-only key
};

/**
 * @brief Check that 32 bytes form a usable secret key (scalar in [1, n-1])
 */
bool is_valid_secret_key(const Bytes& secret_key);

/**
 * @brief Derive the x-only public key for a secret key
 *
 * @throws InputError if the key is not 32 bytes or is outside [1, n-1]
 */
Bytes schnorr_public_key(const Bytes& secret_key);

/**
 * @brief Sign a 32-byte message
 *
 * With the default all-zero aux data the signature is deterministic, so the
 * same key and message always give the same 64 bytes.
 *
 * @throws InputError for an invalid secret key or message length
 */
Bytes schnorr_sign(const Bytes& message, const Bytes& secret_key,
                   const Bytes& aux_rand = Bytes(32, 0));

/**
 * @brief Verify a 64-byte signature against an x-only public key
 *
 * Malformed keys or signatures simply fail verification.
 */
bool schnorr_verify(const Bytes& signature, const Bytes& message, const Bytes& public_key);

/**
 * @brief Generate a fresh random key pair
 *
 * @throws InternalError if the system random source fails
 */
KeyPair generate_keypair();

}  // namespace sil

#endif  // SILVERSCRIPT_CRYPTO_SCHNORR_HPP
