#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace rcauth {

    long now_epoch();
    std::string now_iso_utc();

    // Base64url without padding (libsodium URLSAFE_NO_PADDING variant).
    std::string b64url_enc(const unsigned char* data, size_t len);
    bool b64url_dec(const std::string& s, std::string& out_bin);

    // Random identifiers from libsodium's CSPRNG.
    std::string random_b64url(size_t nbytes);
    std::string random_hex(size_t nbytes);

    // Decode a base64url key from the environment. Returns false if the variable
    // is missing or does not decode to exactly out_len bytes.
    bool load_env_key(const char* name, unsigned char* out, size_t out_len);

    std::string exe_dir();

    // Length of the well-formed UTF-8 sequence starting at s[i] (RFC 3629:
    // no overlongs, surrogates or code points above U+10FFFF), 0 if ill-formed.
    size_t utf8_seq_len(const std::string& s, size_t i);

    // Replace every ill-formed byte with U+FFFD. Valid input comes back unchanged.
    std::string utf8_sanitize(const std::string& s);

    // Longest prefix of s that is at most maxlen bytes and does not end inside
    // a multi-byte sequence.
    size_t utf8_prefix_len(const std::string& s, size_t maxlen);

} // namespace rcauth
