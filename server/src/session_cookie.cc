#include "session_cookie.h"

/*
 * session_cookie.cc
 *
 * Trusted session cookie (rcauth_session):
 *
 *   cookie_value := b64url_no_pad(claims_json) "." b64url_no_pad(hmac_sha256(claims_json, key32))
 *
 *   claims_json  := {"uid":"<user id>","iat":<unix_sec>,"exp":<unix_sec>}
 *
 * - The MAC makes the user id unforgeable without the server key. The claims
 *   are only encoded, not encrypted.
 * - Key order and formatting are part of the format; mint and verify change
 *   together or not at all.
 * - libsodium must be initialized before any of this runs (main() does it).
 */

#include <sodium.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include "audit_log.h"
#include "rcauth_util.h"

namespace rcauth {

bool user_id_well_formed(const std::string& user_id) {
    if (user_id.empty() || user_id.size() > 64) return false;
    for (char c : user_id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace rcauth

static void hmac_claims(const unsigned char key32[32],
                        const std::string& claims,
                        unsigned char out[crypto_auth_hmacsha256_BYTES]) {
    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, key32, 32);
    crypto_auth_hmacsha256_update(&st,
                                  reinterpret_cast<const unsigned char*>(claims.data()),
                                  claims.size());
    crypto_auth_hmacsha256_final(&st, out);
}

// -----------------------------------------------------------------------------
// Mint cookie
// -----------------------------------------------------------------------------

bool session_cookie_mint(const unsigned char key32[32],
                         const std::string& user_id,
                         long iat, long exp,
                         std::string& out_cookie_value) {
    // The user id is spliced into JSON unescaped, so it must not be able to
    // carry quotes or backslashes.
    if (!rcauth::user_id_well_formed(user_id)) return false;

    const std::string claims = std::string("{")
        + "\"uid\":\"" + user_id + "\","
        + "\"iat\":" + std::to_string(iat) + ","
        + "\"exp\":" + std::to_string(exp)
        + "}";

    unsigned char mac[crypto_auth_hmacsha256_BYTES];
    hmac_claims(key32, claims, mac);

    out_cookie_value =
        rcauth::b64url_enc(reinterpret_cast<const unsigned char*>(claims.data()), claims.size())
        + "."
        + rcauth::b64url_enc(mac, sizeof(mac));

    return true;
}

// -----------------------------------------------------------------------------
// Verify cookie
// -----------------------------------------------------------------------------

bool session_cookie_verify(const unsigned char key32[32],
                           const std::string& cookie_value,
                           std::string& out_user_id,
                           long& out_exp) {
    const auto dot = cookie_value.find('.');
    if (dot == std::string::npos) return false;

    std::string claims;
    if (!rcauth::b64url_dec(cookie_value.substr(0, dot), claims)) return false;

    std::string macBin;
    if (!rcauth::b64url_dec(cookie_value.substr(dot + 1), macBin)) return false;
    if (macBin.size() != crypto_auth_hmacsha256_BYTES) return false;

    unsigned char mac2[crypto_auth_hmacsha256_BYTES];
    hmac_claims(key32, claims, mac2);

    // Constant-time compare
    if (sodium_memcmp(mac2, macBin.data(), crypto_auth_hmacsha256_BYTES) != 0) return false;

    // Past this point the claims are ours, byte for byte, so substring
    // extraction against the mint template is sufficient.
    auto p = claims.find("\"uid\":\"");
    if (p == std::string::npos) return false;
    p += 7; // length of `"uid":"`
    auto q = claims.find('"', p);
    if (q == std::string::npos) return false;
    const std::string uid = claims.substr(p, q - p);
    if (!rcauth::user_id_well_formed(uid)) return false;

    auto e = claims.find("\"exp\":");
    if (e == std::string::npos) return false;
    char* endp = nullptr;
    const long exp = std::strtol(claims.c_str() + e + 6, &endp, 10);
    if (endp == claims.c_str() + e + 6) return false;

    out_user_id = uid;
    out_exp = exp;
    return true;
}

// -----------------------------------------------------------------------------
// SessionCookieManager
// -----------------------------------------------------------------------------

namespace rcauth {

SessionCookieManager::SessionCookieManager(SessionCookieConfig cfg,
                                           AuditLog* audit,
                                           std::function<long()> now_epoch)
    : cfg_(std::move(cfg)), audit_(audit), now_epoch_(std::move(now_epoch)) {
    if (!now_epoch_) now_epoch_ = &rcauth::now_epoch;
}

CookieAttrs SessionCookieManager::attrs(long max_age) const {
    CookieAttrs a;
    a.http_only = true;
    a.secure = cfg_.production;
    a.same_site = "Strict";
    a.path = "/";
    a.max_age = max_age;
    return a;
}

void SessionCookieManager::issue(CookieJar& jar, const std::string& user_id) const {
    const long iat = now_epoch_();
    const long exp = iat + cfg_.max_age_sec;

    std::string value;
    if (!session_cookie_mint(cfg_.key.data(), user_id, iat, exp, value)) {
        throw std::invalid_argument("session: malformed user id");
    }

    try {
        jar.set(cfg_.cookie_name, value, attrs(cfg_.max_age_sec));
    } catch (const CookieStoreError& ex) {
        std::cerr << "[session] ERROR: issue failed: " << ex.what() << std::endl;
        if (audit_) {
            AuditEvent ev;
            ev.event = "session.cookie_store_error";
            ev.outcome = "fail";
            ev.f["op"] = "issue";
            ev.f["user_id"] = user_id;
            ev.f["detail"] = ex.what();
            audit_->append(ev);
        }
        throw;
    }

    if (audit_) {
        AuditEvent ev;
        ev.event = "session.cookie_set";
        ev.outcome = "ok";
        ev.f["user_id"] = user_id;
        ev.f["secure"] = cfg_.production ? "true" : "false";
        ev.f["max_age"] = std::to_string(cfg_.max_age_sec);
        audit_->append(ev);
    }
}

void SessionCookieManager::clear(CookieJar& jar) const {
    try {
        jar.set(cfg_.cookie_name, "", attrs(0));
    } catch (const CookieStoreError& ex) {
        std::cerr << "[session] ERROR: clear failed: " << ex.what() << std::endl;
        if (audit_) {
            AuditEvent ev;
            ev.event = "session.cookie_store_error";
            ev.outcome = "fail";
            ev.f["op"] = "clear";
            ev.f["detail"] = ex.what();
            audit_->append(ev);
        }
        throw;
    }

    if (audit_) {
        AuditEvent ev;
        ev.event = "session.cookie_cleared";
        ev.outcome = "ok";
        ev.level = AuditLevel::INFO;
        audit_->append(ev);
    }
}

std::optional<std::string> SessionCookieManager::read(const CookieJar& jar) const {
    auto raw = jar.get(cfg_.cookie_name);
    if (!raw || raw->empty()) return std::nullopt;

    auto reject = [&](const char* reason) -> std::optional<std::string> {
        if (audit_) {
            AuditEvent ev;
            ev.event = "session.read_rejected";
            ev.outcome = "deny";
            ev.level = AuditLevel::INFO;
            ev.f["reason"] = reason;
            audit_->append(ev);
        }
        return std::nullopt;
    };

    std::string uid;
    long exp = 0;
    if (!session_cookie_verify(cfg_.key.data(), *raw, uid, exp)) return reject("bad_cookie");

    // The browser drops the cookie at Max-Age, but the signed expiry is what
    // counts for a replayed value.
    if (now_epoch_() > exp) return reject("expired");

    return uid;
}

} // namespace rcauth
