#pragma once
#include <array>
#include <functional>
#include <optional>
#include <string>

#include "cookie_jar.h"

namespace rcauth { class AuditLog; }

// Low-level cookie value codec:
//   b64url(claims_json) "." b64url(HMAC-SHA256(claims_json, key32))
// claims_json = {"uid":"<user id>","iat":<unix>,"exp":<unix>}
//
// mint fails only if user_id is not well formed (see user_id_well_formed).
bool session_cookie_mint(const unsigned char key32[32],
                         const std::string& user_id,
                         long iat, long exp,
                         std::string& out_cookie_value);

bool session_cookie_verify(const unsigned char key32[32],
                           const std::string& cookie_value,
                           std::string& out_user_id,
                           long& out_exp);

namespace rcauth {

// 1..64 chars of [A-Za-z0-9_-].
bool user_id_well_formed(const std::string& user_id);

inline constexpr long kSessionMaxAgeSec = 60L * 60 * 24 * 30; // 30 days

struct SessionCookieConfig {
    std::string cookie_name = "rcauth_session";
    std::array<unsigned char, 32> key{};
    long max_age_sec = kSessionMaxAgeSec;

    // Production deployments only send the cookie over TLS (Secure).
    // Decided once at startup, never from the environment at call time.
    bool production = false;
};

/*
SessionCookieManager
====================

Owns the trusted identity cookie. This is the only thing protected code may
ask "who is this request?": the advisory cookie exists for UI hints and is
never consulted here.

Cookie attributes: HttpOnly, SameSite=Strict, Path=/, Max-Age=30 days and
Secure in production.

Errors:
- issue()/clear() propagate CookieStoreError from the jar (after auditing it).
  A caller must not report a successful login unless issue() returned.
- read() returns std::nullopt for an absent, forged, expired or malformed
  cookie. Only failures of the jar itself escape as exceptions.
*/
class SessionCookieManager {
public:
    SessionCookieManager(SessionCookieConfig cfg,
                         AuditLog* audit,
                         std::function<long()> now_epoch);

    void issue(CookieJar& jar, const std::string& user_id) const;
    void clear(CookieJar& jar) const;
    std::optional<std::string> read(const CookieJar& jar) const;

    CookieAttrs attrs(long max_age) const;
    const SessionCookieConfig& config() const { return cfg_; }

private:
    SessionCookieConfig cfg_;
    AuditLog* audit_;
    std::function<long()> now_epoch_;
};

} // namespace rcauth
