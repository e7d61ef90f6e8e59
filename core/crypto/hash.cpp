// ==============================================================================
// Hash Functions - Implementation
// ==============================================================================

#include "hash.hpp"
#include "error.hpp"
#include <openssl/evp.h>

namespace sil {

Bytes sha256(const Bytes& data) {
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw InternalError("SHA-256 digest failed");
    }
    digest.resize(digest_len);
    return digest;
}

Bytes tagged_hash(const std::string& tag, const Bytes& data) {
    Bytes tag_hash = sha256(Bytes(tag.begin(), tag.end()));

    Bytes preimage;
    preimage.reserve(2 * HASH_SIZE + data.size());
    preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
    preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
    preimage.insert(preimage.end(), data.begin(), data.end());
    return sha256(preimage);
}

}  // namespace sil
