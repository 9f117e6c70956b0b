// tools/rcauth_keygen.cpp
//
// Prints fresh server secrets as shell exports:
//
//   ./build/bin/rcauth_keygen > .env.rcauth && source .env.rcauth
//
// RCAUTH_COOKIE_KEY_B64URL   HMAC key for rcauth_session (rotating it logs everyone out)
// RCAUTH_CODE_PEPPER_B64URL  key for recovery code digests (rotating it invalidates every code)

#include <sodium.h>

#include <iostream>

#include "rcauth_util.h"

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 1;
    }

    unsigned char cookie_key[32];
    unsigned char pepper[32];
    randombytes_buf(cookie_key, sizeof(cookie_key));
    randombytes_buf(pepper, sizeof(pepper));

    std::cout << "export RCAUTH_COOKIE_KEY_B64URL=" << rcauth::b64url_enc(cookie_key, sizeof(cookie_key)) << "\n";
    std::cout << "export RCAUTH_CODE_PEPPER_B64URL=" << rcauth::b64url_enc(pepper, sizeof(pepper)) << "\n";

    sodium_memzero(cookie_key, sizeof(cookie_key));
    sodium_memzero(pepper, sizeof(pepper));
    return 0;
}
