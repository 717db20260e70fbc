/*
 * crypto.cpp
 *
 * Random passwords and SHA-256 on top of libsodium.
 */

#include "crypto.h"
#include <sodium.h>
#include <cstring>

namespace bashdrop {
namespace crypto {

bool init() {
    /*
     * sodium_init() returns 0 on success, -1 on failure, and 1 if already initialized.
     * We treat both 0 and 1 as success.
     */
    return sodium_init() >= 0;
}

void random_bytes(uint8_t* buf, size_t len) {
    randombytes_buf(buf, len);
}

std::string generate_password(size_t length) {
    const size_t alphabet_len = std::strlen(PASSWORD_ALPHABET);
    std::string password;
    password.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        /* randombytes_uniform avoids modulo bias */
        uint32_t index = randombytes_uniform(static_cast<uint32_t>(alphabet_len));
        password.push_back(PASSWORD_ALPHABET[index]);
    }
    return password;
}

void sha256(const uint8_t* data, size_t len, uint8_t* hash) {
    crypto_hash_sha256(hash, data, len);
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    uint8_t hash[HASH_SIZE];
    sha256(data, len, hash);

    char hex[HASH_HEX_SIZE + 1];
    sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
    return std::string(hex, HASH_HEX_SIZE);
}

bool secure_compare(const uint8_t* a, const uint8_t* b, size_t len) {
    return sodium_memcmp(a, b, len) == 0;
}

}  /* namespace crypto */
}  /* namespace bashdrop */
