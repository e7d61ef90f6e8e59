// ==============================================================================
// Hash and Schnorr Signature Tests
// ==============================================================================
// Tests SHA-256, BIP340 signing and verification, and key generation.
// ==============================================================================

#include "schnorr.hpp"
#include "hash.hpp"
#include "tx_context.hpp"
#include "error.hpp"
#include <algorithm>
#include <iostream>

using namespace sil;

static int test_count = 0;
static int pass_count = 0;

static bool had_failure = false;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << "\n";
    } else {
        std::cout << "FAIL: " << name << "\n";
        had_failure = true;
    }
}

static Bytes hex(const std::string& text) {
    return *from_hex(text);
}

static Bytes key_ending_in(Byte last) {
    Bytes key(32, 0);
    key[31] = last;
    return key;
}

// ==============================================================================
// Hashing
// ==============================================================================

static void test_sha256() {
    std::cout << "\n--- SHA-256 ---\n";

    Bytes abc = {'a', 'b', 'c'};
    check(to_hex(sha256(abc)) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
          "sha256(\"abc\")");
    check(to_hex(sha256({})) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
          "sha256 of empty input");
    check(sha256(abc).size() == HASH_SIZE, "digest is 32 bytes");

    Bytes tagged = tagged_hash("BIP0340/challenge", abc);
    check(tagged.size() == HASH_SIZE, "tagged hash is 32 bytes");
    check(tagged != sha256(abc), "tag changes the digest");
    check(tagged != tagged_hash("BIP0340/nonce", abc), "different tags differ");
}

// ==============================================================================
// Signatures
// ==============================================================================

static void test_bip340_vector() {
    std::cout << "\n--- BIP340 Test Vector 0 ---\n";

    Bytes secret = key_ending_in(3);
    Bytes message(32, 0);

    Bytes pubkey = schnorr_public_key(secret);
    check(to_hex(pubkey) ==
          "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9",
          "public key of secret 3");

    Bytes sig = schnorr_sign(message, secret);
    check(to_hex(sig) ==
          "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca8215"
          "25f66a4a85ea8b71e482a74f382d2ce5ebeee8fdb2172f477df4900d310536c0",
          "signature matches the vector");
    check(schnorr_verify(sig, message, pubkey), "vector signature verifies");
}

static void test_sign_verify() {
    std::cout << "\n--- Sign and Verify ---\n";

    Bytes secret = key_ending_in(1);
    Bytes pubkey = schnorr_public_key(secret);
    Bytes message = sha256(Bytes{'s', 'p', 'e', 'n', 'd'});

    Bytes sig = schnorr_sign(message, secret);
    check(sig.size() == SCHNORR_SIGNATURE_SIZE, "signature is 64 bytes");
    check(schnorr_verify(sig, message, pubkey), "signature verifies");
    check(schnorr_sign(message, secret) == sig, "signing is deterministic");

    Bytes tampered_message = message;
    tampered_message[0] ^= 0x01;
    check(!schnorr_verify(sig, tampered_message, pubkey), "tampered message fails");

    Bytes tampered_sig = sig;
    tampered_sig[63] ^= 0x01;
    check(!schnorr_verify(tampered_sig, message, pubkey), "tampered signature fails");

    Bytes other_pubkey = schnorr_public_key(key_ending_in(2));
    check(!schnorr_verify(sig, message, other_pubkey), "wrong key fails");

    check(!schnorr_verify(Bytes(10, 0), message, pubkey), "short signature fails");
    check(!schnorr_verify(sig, message, Bytes(33, 0x02)), "33-byte key fails");

    check(!schnorr_verify(sig, message, Bytes(32, 0xff)), "key above the field prime fails");
}

static void test_aux_randomness() {
    std::cout << "\n--- Auxiliary Randomness ---\n";

    Bytes secret = key_ending_in(7);
    Bytes pubkey = schnorr_public_key(secret);
    Bytes message = sha256(Bytes{'a', 'u', 'x'});

    Bytes plain = schnorr_sign(message, secret);
    Bytes salted = schnorr_sign(message, secret, Bytes(32, 0x5a));
    check(plain != salted, "aux data changes the nonce");
    check(schnorr_verify(salted, message, pubkey), "salted signature verifies");
    check(!std::equal(plain.begin(), plain.begin() + 32, salted.begin()),
          "different R for different aux data");

    bool caught = false;
    try {
        schnorr_sign(message, secret, Bytes(16, 0));
    } catch (const InputError&) {
        caught = true;
    }
    check(caught, "short aux data throws InputError");
}

static void test_secret_keys() {
    std::cout << "\n--- Secret Keys ---\n";

    check(is_valid_secret_key(key_ending_in(1)), "1 is a valid key");
    check(!is_valid_secret_key(Bytes(32, 0)), "zero is not a valid key");
    check(!is_valid_secret_key(Bytes(32, 0xff)), "key above the order is invalid");
    check(!is_valid_secret_key(Bytes(31, 1)), "31-byte key is invalid");
    check(!is_valid_secret_key(hex(
              "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")),
          "the group order itself is invalid");

    bool caught = false;
    try {
        schnorr_public_key(Bytes(32, 0));
    } catch (const InputError&) {
        caught = true;
    }
    check(caught, "public key of zero throws InputError");

    caught = false;
    try {
        schnorr_sign(Bytes(31, 0), key_ending_in(1));
    } catch (const InputError&) {
        caught = true;
    }
    check(caught, "31-byte message throws InputError");
}

static void test_generate_keypair() {
    std::cout << "\n--- Key Generation ---\n";

    KeyPair a = generate_keypair();
    KeyPair b = generate_keypair();

    check(a.secret_key.size() == SECRET_KEY_SIZE, "secret key is 32 bytes");
    check(a.public_key.size() == XONLY_PUBKEY_SIZE, "public key is 32 bytes");
    check(is_valid_secret_key(a.secret_key), "generated key is in range");
    check(schnorr_public_key(a.secret_key) == a.public_key, "public key matches secret");
    check(a.secret_key != b.secret_key, "two draws differ");

    Bytes message = sha256(a.public_key);
    check(schnorr_verify(schnorr_sign(message, a.secret_key), message, a.public_key),
          "generated pair signs and verifies");
}

// ==============================================================================
// Transaction Digest
// ==============================================================================

static void test_signature_hash() {
    std::cout << "\n--- Signature Hash ---\n";

    Bytes locking = {0x51};
    TransactionContext tx = TransactionContext::canonical(locking);
    Bytes digest = tx.signature_hash(SIGHASH_ALL);
    check(digest.size() == HASH_SIZE, "digest is 32 bytes");

    TransactionContext with_sigscript = TransactionContext::canonical(locking, {0x01, 0x02});
    check(with_sigscript.signature_hash(SIGHASH_ALL) == digest,
          "signature script is not committed to");

    TransactionContext other = TransactionContext::canonical({0x52});
    check(other.signature_hash(SIGHASH_ALL) != digest, "locking script is committed to");

    bool caught = false;
    try {
        tx.signature_hash(0x02);
    } catch (const ExecutionError&) {
        caught = true;
    }
    check(caught, "unsupported hash type throws");
}

int main() {
    std::cout << "=== Hash and Schnorr Tests ===\n";

    test_sha256();
    test_bip340_vector();
    test_sign_verify();
    test_aux_randomness();
    test_secret_keys();
    test_generate_keypair();
    test_signature_hash();

    std::cout << "\n=== " << pass_count << "/" << test_count
              << " tests passed! ===\n";
    if (had_failure) {
        std::cout << "SOME TESTS FAILED\n";
        return 1;
    }
    return 0;
}
