// ==============================================================================
// Hash Functions
// ==============================================================================
// SHA-256 and the BIP340 tagged hash built on top of it.
// ==============================================================================

#ifndef SILVERSCRIPT_CRYPTO_HASH_HPP
#define SILVERSCRIPT_CRYPTO_HASH_HPP

#include "types.hpp"
#include <string>

namespace sil {

constexpr size_t HASH_SIZE = 32;

/**
 * @brief SHA-256 digest (32 bytes)
 *
 * @throws InternalError if the digest cannot be computed
 */
Bytes sha256(const Bytes& data);

/**
 * @brief BIP340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data)
 *
 * Example: tagged_hash("BIP0340/challenge", r || p || m)
 */
Bytes tagged_hash(const std::string& tag, const Bytes& data);

}  // namespace sil

#endif  // SILVERSCRIPT_CRYPTO_HASH_HPP
