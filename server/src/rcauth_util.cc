#include "rcauth_util.h"

#include <sodium.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unistd.h>
#include <limits.h>

namespace rcauth {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

// libsodium writes a NUL-terminated string; shrink to the C-string length.
std::string b64url_enc(const unsigned char* data, size_t len) {
    const size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len,
                      sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    out.resize(std::strlen(out.c_str()));
    return out;
}

bool b64url_dec(const std::string& s, std::string& out_bin) {
    // Decoded length is <= encoded length.
    out_bin.resize(s.size());

    size_t out_len = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(out_bin.data()), out_bin.size(),
                          s.c_str(), s.size(),
                          /*ignore=*/nullptr,
                          /*out_len=*/&out_len,
                          /*b64_end=*/nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return false;
    }

    out_bin.resize(out_len);
    return true;
}

std::string random_b64url(size_t nbytes) {
    std::string b(nbytes, '\0');
    randombytes_buf(b.data(), b.size());
    return b64url_enc(reinterpret_cast<const unsigned char*>(b.data()), b.size());
}

std::string random_hex(size_t nbytes) {
    std::vector<unsigned char> b(nbytes);
    randombytes_buf(b.data(), b.size());

    std::string hex(nbytes * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), b.data(), b.size());
    hex.resize(nbytes * 2);
    return hex;
}

bool load_env_key(const char* name, unsigned char* out, size_t out_len) {
    const char* s = std::getenv(name);
    if (!s) return false;
    size_t got = 0;
    if (sodium_base642bin(out, out_len, s, std::strlen(s),
                          nullptr, &got, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) return false;
    return got == out_len;
}

std::string exe_dir() {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    buf[n] = '\0';
    return std::filesystem::path(buf).parent_path().string();
}

static bool cont(unsigned char c) { return c >= 0x80 && c <= 0xBF; }

size_t utf8_seq_len(const std::string& s, size_t i) {
    const size_t n = s.size();
    if (i >= n) return 0;
    const unsigned char c = (unsigned char)s[i];
    auto at = [&](size_t k) -> unsigned char { return i + k < n ? (unsigned char)s[i + k] : 0; };

    if (c <= 0x7F) return 1;
    if (c >= 0xC2 && c <= 0xDF) return cont(at(1)) ? 2 : 0;
    if (c == 0xE0) return (at(1) >= 0xA0 && at(1) <= 0xBF && cont(at(2))) ? 3 : 0;
    if (c == 0xED) return (at(1) >= 0x80 && at(1) <= 0x9F && cont(at(2))) ? 3 : 0;
    if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) return (cont(at(1)) && cont(at(2))) ? 3 : 0;
    if (c == 0xF0) return (at(1) >= 0x90 && at(1) <= 0xBF && cont(at(2)) && cont(at(3))) ? 4 : 0;
    if (c >= 0xF1 && c <= 0xF3) return (cont(at(1)) && cont(at(2)) && cont(at(3))) ? 4 : 0;
    if (c == 0xF4) return (at(1) >= 0x80 && at(1) <= 0x8F && cont(at(2)) && cont(at(3))) ? 4 : 0;
    return 0;
}

std::string utf8_sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const size_t len = utf8_seq_len(s, i);
        if (len == 0) {
            out += "\xEF\xBF\xBD"; // U+FFFD
            i++;
            continue;
        }
        out.append(s, i, len);
        i += len;
    }
    return out;
}

size_t utf8_prefix_len(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s.size();
    size_t cut = maxlen;
    // Back off over continuation bytes to the start of the last sequence.
    while (cut > 0 && cont((unsigned char)s[cut])) cut--;
    return cut;
}

} // namespace rcauth
