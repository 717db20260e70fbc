/*
 * crypto.h
 *
 * Cryptographic helpers for bashdrop.
 * Provides:
 * - Secure random bytes and session passwords
 * - Hashing (SHA-256)
 *
 * The relay itself never hashes or encrypts payload bytes. These helpers
 * serve the session setup (password generation) and the peer-side framing
 * utilities in mode.h. All functions use libsodium.
 */

#ifndef BASHDROP_CRYPTO_H
#define BASHDROP_CRYPTO_H

#include <cstdint>
#include <cstddef>
#include <string>

namespace bashdrop {
namespace crypto {

constexpr size_t HASH_SIZE = 32;       /* SHA-256 output */
constexpr size_t HASH_HEX_SIZE = 64;   /* SHA-256 output, lowercase hex */

/* Alphabet for generated passwords: [A-Za-z0-9] */
constexpr const char* PASSWORD_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr size_t DEFAULT_PASSWORD_LENGTH = 10;

/*
 * Initializes the cryptographic subsystem.
 * Must be called once before any other crypto functions.
 *
 * @return true on success, false if initialization failed
 */
bool init();

/*
 * Fills a buffer with cryptographically secure random bytes.
 *
 * @param buf    Pointer to buffer to fill
 * @param len    Number of random bytes to generate
 */
void random_bytes(uint8_t* buf, size_t len);

/*
 * Generates a random password drawn uniformly from PASSWORD_ALPHABET.
 * The result is safe to paste into a shell command unquoted.
 *
 * @param length  Number of characters
 */
std::string generate_password(size_t length = DEFAULT_PASSWORD_LENGTH);

/*
 * Computes SHA-256 hash of input data.
 *
 * @param data  Input data to hash
 * @param len   Length of input data
 * @param hash  Output buffer for 32-byte hash
 */
void sha256(const uint8_t* data, size_t len, uint8_t* hash);

/*
 * SHA-256 as 64 lowercase hex characters, the format sha256sum prints.
 */
std::string sha256_hex(const uint8_t* data, size_t len);

/*
 * Securely compares two byte arrays in constant time.
 */
bool secure_compare(const uint8_t* a, const uint8_t* b, size_t len);

}  /* namespace crypto */
}  /* namespace bashdrop */

#endif  /* BASHDROP_CRYPTO_H */
