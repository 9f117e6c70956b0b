#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace rcauth {

/*
Recovery code format
====================

A recovery code is the only credential a user holds. It is 12 symbols drawn
from a 31 character alphabet, shown to the user as three groups of four:

    XXXX-XXXX-XXXX

Alphabet: A-Z without O, I, L and 2-9 (no 0 or 1), so the code can be read
back from paper without confusing O/0 or I/L/1.

Generation, validation and normalization all use kRecoveryAlphabet below.
*/

inline constexpr char kRecoveryAlphabet[] = "ABCDEFGHJKMNPQRSTUVWXYZ23456789";
inline constexpr std::size_t kRecoveryAlphabetSize = sizeof(kRecoveryAlphabet) - 1;

inline constexpr std::size_t kRecoverySymbols   = 12; // meaningful symbols
inline constexpr std::size_t kRecoveryGroupLen  = 4;
inline constexpr char        kRecoveryDelimiter = '-';
inline constexpr std::size_t kRecoveryCanonicalLen =
    kRecoverySymbols + (kRecoverySymbols / kRecoveryGroupLen) - 1; // 14

static_assert(kRecoverySymbols % kRecoveryGroupLen == 0, "groups must tile the code");
static_assert(kRecoveryAlphabetSize > 1 && kRecoveryAlphabetSize <= 256,
              "alphabet must be indexable by one byte");

// True if c is one of the alphabet symbols (upper case only).
bool recovery_code_is_symbol(char c);

// Mint a new code in canonical form from libsodium's CSPRNG.
// Throws std::runtime_error if libsodium cannot be initialized; there is no
// fallback random source.
std::string recovery_code_generate();

// Strict check of an already-canonical code: exactly 14 chars, three groups
// of four alphabet symbols separated by '-'. Never throws.
bool recovery_code_is_valid(const std::string& code);

// Tolerant parse of user input: whitespace and '-' are dropped, letters are
// upper-cased, and exactly 12 alphabet symbols must remain. Whitespace means
// ASCII space/tab/CR/LF/VT/FF plus UTF-8 encoded Unicode spaces that pasted
// text carries (U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F,
// U+205F, U+3000, U+FEFF).
// Returns the canonical form, or std::nullopt for anything else.
std::optional<std::string> recovery_code_normalize(const std::string& input);

// Keyed digest stored in place of the code (BLAKE2b-256 keyed with a server
// pepper, lowercase hex). `canonical` must already be normalized.
std::string recovery_code_digest_hex(const unsigned char pepper32[32],
                                     const std::string& canonical);

// Constant-time comparison of two digests produced above.
bool recovery_digest_equal(const std::string& a_hex, const std::string& b_hex);

} // namespace rcauth
