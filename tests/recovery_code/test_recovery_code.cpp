// tests/recovery_code/test_recovery_code.cpp
//
// Recovery code format regression test.
//
// What it tests:
// 1) Generated codes are canonical and never contain 0, 1, O, I, L
// 2) Validation is strict (length, delimiter placement, alphabet)
// 3) Normalization accepts case/space/dash variants and is idempotent
// 4) Symbol frequencies over many generated codes are uniform (chi-square)
// 5) Storage digests are keyed and deterministic
//
// Build target should link recovery_code.cc.

#include <sodium.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "recovery_code.h"

using rcauth::recovery_code_digest_hex;
using rcauth::recovery_code_generate;
using rcauth::recovery_code_is_valid;
using rcauth::recovery_code_normalize;

static int failures = 0;

static void expect(bool cond, const char* name, const std::string& detail = "") {
    if (cond) return;
    std::fprintf(stderr, "[%s] FAIL%s%s\n", name, detail.empty() ? "" : ": ", detail.c_str());
    failures++;
}

static std::string show(const std::optional<std::string>& v) {
    return v ? "\"" + *v + "\"" : "nullopt";
}

static void test_alphabet() {
    expect(rcauth::kRecoveryAlphabetSize == 31, "alphabet_size",
           std::to_string(rcauth::kRecoveryAlphabetSize));
    expect(rcauth::kRecoveryCanonicalLen == 14, "canonical_len");

    std::set<char> seen;
    for (size_t i = 0; i < rcauth::kRecoveryAlphabetSize; i++) seen.insert(rcauth::kRecoveryAlphabet[i]);
    expect(seen.size() == rcauth::kRecoveryAlphabetSize, "alphabet_no_duplicates");

    for (char c : std::string("01OIL")) {
        expect(!rcauth::recovery_code_is_symbol(c), "alphabet_excludes_ambiguous", std::string(1, c));
    }
    expect(!rcauth::recovery_code_is_symbol('\0'), "alphabet_excludes_nul");
    expect(!rcauth::recovery_code_is_symbol('a'), "alphabet_upper_only");
}

static void test_generate() {
    std::set<std::string> distinct;
    for (int i = 0; i < 2000; i++) {
        const std::string code = recovery_code_generate();
        if (!recovery_code_is_valid(code)) {
            expect(false, "generate_valid", code);
            return;
        }
        if (code.find_first_of("01OIL") != std::string::npos) {
            expect(false, "generate_no_ambiguous", code);
            return;
        }
        expect(recovery_code_normalize(code) == code, "generate_is_canonical", code);
        distinct.insert(code);
    }
    // ~59 bits per code: any repeat in 2000 draws means the source is broken.
    expect(distinct.size() == 2000, "generate_distinct", std::to_string(distinct.size()));
}

static void test_validate() {
    expect(recovery_code_is_valid("AB2C-XY73-MN89"), "validate_example");
    expect(!recovery_code_is_valid("AB2C-XY73-MN8"), "validate_too_short");
    expect(!recovery_code_is_valid("AB2C-XY73-MN899"), "validate_too_long");
    expect(!recovery_code_is_valid(""), "validate_empty");
    expect(!recovery_code_is_valid("ab2c-xy73-mn89"), "validate_lowercase");
    expect(!recovery_code_is_valid("AB2CXY73MN89"), "validate_no_dashes");
    expect(!recovery_code_is_valid("AB2C XY73 MN89"), "validate_spaces");
    expect(!recovery_code_is_valid("AB2-CXY73-MN89"), "validate_dash_misplaced");
    expect(!recovery_code_is_valid("AB2C_XY73_MN89"), "validate_wrong_delimiter");
    expect(!recovery_code_is_valid("AB0C-XY73-MN89"), "validate_zero");
    expect(!recovery_code_is_valid("AB1C-XY73-MN89"), "validate_one");
    expect(!recovery_code_is_valid("ABOC-XY73-MN89"), "validate_letter_o");
    expect(!recovery_code_is_valid("ABIC-XY73-MN89"), "validate_letter_i");
    expect(!recovery_code_is_valid("ABLC-XY73-MN89"), "validate_letter_l");
    expect(!recovery_code_is_valid("AB2C-XY73-MN8\n"), "validate_newline");

    std::string with_nul("AB2C-XY73-MN89");
    with_nul[3] = '\0';
    expect(!recovery_code_is_valid(with_nul), "validate_embedded_nul");
}

static void test_normalize() {
    const std::string want = "AB2C-XY73-MN89";

    expect(recovery_code_normalize("ab2c xy73 mn89") == want, "normalize_spaces_lower",
           show(recovery_code_normalize("ab2c xy73 mn89")));
    expect(recovery_code_normalize("AB2C-XY73-MN89") == want, "normalize_canonical");
    expect(recovery_code_normalize("ab2cxy73mn89") == want, "normalize_compact");
    expect(recovery_code_normalize("  AB2C--XY73\t-mn89 \n") == want, "normalize_messy");
    expect(recovery_code_normalize("A-B-2-C-X-Y-7-3-M-N-8-9") == want, "normalize_dash_every_char");

    // Pasted text: no-break spaces, thin/narrow spaces, ideographic space, BOM.
    expect(recovery_code_normalize("AB2C\xC2\xA0XY73\xC2\xA0MN89") == want, "normalize_nbsp",
           show(recovery_code_normalize("AB2C\xC2\xA0XY73\xC2\xA0MN89")));
    expect(recovery_code_normalize("\xEF\xBB\xBF" "ab2c\xE2\x80\x89xy73\xE2\x80\xAF" "mn89\xE3\x80\x80") == want,
           "normalize_unicode_spaces");
    expect(!recovery_code_normalize("AB2C\xC2\xA1XY73MN89"), "normalize_other_latin1_rejected");
    expect(!recovery_code_normalize("AB2C\xE2\x80\x8BXY73MN89"), "normalize_zero_width_rejected");

    expect(!recovery_code_normalize(""), "normalize_empty");
    expect(!recovery_code_normalize("invalid"), "normalize_invalid");
    expect(!recovery_code_normalize("AB2C-XY73-MN8"), "normalize_11_symbols");
    expect(!recovery_code_normalize("AB2C-XY73-MN899"), "normalize_13_symbols");
    expect(!recovery_code_normalize("AB2C-XY73-MN80"), "normalize_zero");
    expect(!recovery_code_normalize("ab2c-xy73-mnl9"), "normalize_lower_l");
    expect(!recovery_code_normalize("AB2C.XY73.MN89"), "normalize_dot_delimiter");
    expect(!recovery_code_normalize("AB2C-XY73-MN8\xC3\x89"), "normalize_non_ascii");
    expect(!recovery_code_normalize("AB2C-XY73-MN89; DROP TABLE"), "normalize_trailing_junk");
    expect(!recovery_code_normalize(std::string(10000, 'A')), "normalize_huge");

    // Idempotent and always produces something Validate accepts.
    const char* inputs[] = {"ab2c xy73 mn89", "zzzz-zzzz-2222", " h j k m n p q r s t u v "};
    for (const char* in : inputs) {
        auto once = recovery_code_normalize(in);
        if (!once) {
            expect(false, "normalize_accepts", in);
            continue;
        }
        expect(recovery_code_is_valid(*once), "normalize_output_valid", *once);
        expect(recovery_code_normalize(*once) == once, "normalize_idempotent", *once);
    }
}

static void test_uniformity() {
    // 20000 codes x 12 symbols = 240000 draws over 31 symbols. With 30
    // degrees of freedom, chi2 > 80 has probability ~2e-6 for a fair source.
    // A plain `byte % 31` mapping gives chi2 in the thousands at this size.
    const int kCodes = 20000;
    std::array<long, 256> counts{};

    for (int i = 0; i < kCodes; i++) {
        for (char c : recovery_code_generate()) {
            if (c != rcauth::kRecoveryDelimiter) counts[(unsigned char)c]++;
        }
    }

    const double n = double(kCodes) * rcauth::kRecoverySymbols;
    const double expected = n / rcauth::kRecoveryAlphabetSize;
    double chi2 = 0;
    for (size_t i = 0; i < rcauth::kRecoveryAlphabetSize; i++) {
        const double d = counts[(unsigned char)rcauth::kRecoveryAlphabet[i]] - expected;
        chi2 += d * d / expected;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "chi2=%.2f", chi2);
    expect(chi2 < 80.0, "generate_uniform", buf);
    std::printf("[generate_uniform] %s (df=30)\n", buf);
}

static void test_digest() {
    unsigned char k1[32], k2[32];
    for (size_t i = 0; i < 32; i++) { k1[i] = (unsigned char)i; k2[i] = (unsigned char)(i + 1); }

    const std::string a = recovery_code_digest_hex(k1, "AB2C-XY73-MN89");
    const std::string b = recovery_code_digest_hex(k1, "AB2C-XY73-MN89");
    const std::string c = recovery_code_digest_hex(k2, "AB2C-XY73-MN89");
    const std::string d = recovery_code_digest_hex(k1, "AB2C-XY73-MN8A");

    expect(a.size() == 64, "digest_hex_len", std::to_string(a.size()));
    expect(a == b, "digest_deterministic");
    expect(a != c, "digest_keyed");
    expect(a != d, "digest_distinguishes_codes");
    expect(a.find("AB2C") == std::string::npos, "digest_not_plaintext");

    expect(rcauth::recovery_digest_equal(a, b), "digest_equal_same");
    expect(!rcauth::recovery_digest_equal(a, d), "digest_equal_different");
    expect(!rcauth::recovery_digest_equal("", ""), "digest_equal_empty");
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 2;
    }

    test_alphabet();
    test_generate();
    test_validate();
    test_normalize();
    test_uniformity();
    test_digest();

    if (failures) {
        std::fprintf(stderr, "[recovery_code] FAILURES: %d\n", failures);
        return 1;
    }

    std::printf("[recovery_code] ALL OK\n");
    return 0;
}
