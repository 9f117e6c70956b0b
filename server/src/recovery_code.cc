#include "recovery_code.h"

#include <sodium.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace rcauth {

// -----------------------------------------------------------------------------
// Byte -> symbol mapping
// -----------------------------------------------------------------------------
//
// A random byte is reduced modulo the alphabet size. That is only unbiased when
// the size divides 256, so bytes at or above the largest multiple of the size
// are thrown away and re-drawn. With 32 symbols nothing is rejected; with the
// current 31 symbols bytes 248..255 are rejected (~3%).
static constexpr unsigned kByteRange   = 256;
static constexpr unsigned kAcceptBelow = kByteRange - (kByteRange % kRecoveryAlphabetSize);

static_assert(kAcceptBelow % kRecoveryAlphabetSize == 0, "accept range must tile the alphabet");

// "ABCDEFGHJKMN" -> "ABCD-EFGH-JKMN"
static std::string group_symbols(const std::string& symbols) {
    std::string out;
    out.reserve(kRecoveryCanonicalLen);
    for (std::size_t i = 0; i < symbols.size(); i++) {
        if (i != 0 && i % kRecoveryGroupLen == 0) out.push_back(kRecoveryDelimiter);
        out.push_back(symbols[i]);
    }
    return out;
}

bool recovery_code_is_symbol(char c) {
    if (c == '\0') return false;
    return std::memchr(kRecoveryAlphabet, c, kRecoveryAlphabetSize) != nullptr;
}

// -----------------------------------------------------------------------------
// Generate
// -----------------------------------------------------------------------------

std::string recovery_code_generate() {
    // sodium_init() is idempotent and thread-safe; calling it here means a
    // broken CSPRNG fails this call instead of producing a weak code.
    if (sodium_init() < 0) {
        throw std::runtime_error("recovery code: libsodium random source unavailable");
    }

    std::string symbols;
    symbols.reserve(kRecoverySymbols);

    unsigned char buf[kRecoverySymbols];
    while (symbols.size() < kRecoverySymbols) {
        randombytes_buf(buf, sizeof(buf));
        for (unsigned char b : buf) {
            if (b >= kAcceptBelow) continue; // rejected, keep drawing
            symbols.push_back(kRecoveryAlphabet[b % kRecoveryAlphabetSize]);
            if (symbols.size() == kRecoverySymbols) break;
        }
    }
    sodium_memzero(buf, sizeof(buf));

    std::string code = group_symbols(symbols);
    sodium_memzero(symbols.data(), symbols.size());
    return code;
}

// -----------------------------------------------------------------------------
// Validate (strict, canonical input only)
// -----------------------------------------------------------------------------

bool recovery_code_is_valid(const std::string& code) {
    if (code.size() != kRecoveryCanonicalLen) return false;

    for (std::size_t i = 0; i < code.size(); i++) {
        const bool delim_pos = (i % (kRecoveryGroupLen + 1)) == kRecoveryGroupLen;
        if (delim_pos) {
            if (code[i] != kRecoveryDelimiter) return false;
        } else if (!recovery_code_is_symbol(code[i])) {
            return false;
        }
    }
    return true;
}

// -----------------------------------------------------------------------------
// Normalize (tolerant, user input)
// -----------------------------------------------------------------------------

// Byte length of a UTF-8 encoded Unicode space at input[i], 0 if none.
static std::size_t unicode_space_len(const std::string& in, std::size_t i) {
    auto at = [&](std::size_t k) -> unsigned char {
        return i + k < in.size() ? static_cast<unsigned char>(in[i + k]) : 0;
    };
    const unsigned char b0 = at(0);
    if (b0 == 0xC2 && at(1) == 0xA0) return 2;                        // U+00A0
    if (b0 == 0xE1 && at(1) == 0x9A && at(2) == 0x80) return 3;       // U+1680
    if (b0 == 0xE2 && at(1) == 0x80) {
        const unsigned char b2 = at(2);
        if ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) return 3;
    }
    if (b0 == 0xE2 && at(1) == 0x81 && at(2) == 0x9F) return 3;       // U+205F
    if (b0 == 0xE3 && at(1) == 0x80 && at(2) == 0x80) return 3;       // U+3000
    if (b0 == 0xEF && at(1) == 0xBB && at(2) == 0xBF) return 3;       // U+FEFF
    return 0;
}

std::optional<std::string> recovery_code_normalize(const std::string& input) {
    std::string cleaned;
    cleaned.reserve(kRecoverySymbols);

    std::size_t i = 0;
    while (i < input.size()) {
        const unsigned char uc = static_cast<unsigned char>(input[i]);
        if (input[i] == kRecoveryDelimiter || std::isspace(uc)) {
            i++;
            continue;
        }
        if (const std::size_t n = unicode_space_len(input, i)) {
            i += n;
            continue;
        }
        // Anything past 12 symbols can never normalize; stop scanning early.
        if (cleaned.size() == kRecoverySymbols) return std::nullopt;
        cleaned.push_back(static_cast<char>(std::toupper(uc)));
        i++;
    }

    if (cleaned.size() != kRecoverySymbols) return std::nullopt;

    for (char c : cleaned) {
        if (!recovery_code_is_symbol(c)) return std::nullopt;
    }

    return group_symbols(cleaned);
}

// -----------------------------------------------------------------------------
// Storage digest
// -----------------------------------------------------------------------------

std::string recovery_code_digest_hex(const unsigned char pepper32[32],
                                     const std::string& canonical) {
    unsigned char h[crypto_generichash_BYTES]; // 32
    if (crypto_generichash(h, sizeof(h),
                           reinterpret_cast<const unsigned char*>(canonical.data()),
                           canonical.size(),
                           pepper32, 32) != 0) {
        throw std::runtime_error("recovery code: digest failed");
    }

    std::string hex(sizeof(h) * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), h, sizeof(h));
    hex.resize(sizeof(h) * 2);
    return hex;
}

bool recovery_digest_equal(const std::string& a_hex, const std::string& b_hex) {
    if (a_hex.size() != b_hex.size() || a_hex.empty()) return false;
    return sodium_memcmp(a_hex.data(), b_hex.data(), a_hex.size()) == 0;
}

} // namespace rcauth
