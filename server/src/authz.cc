#include "authz.h"

#include "cookie_jar.h"
#include "session_cookie.h"
#include "users_registry.h"

#include <nlohmann/json.hpp>

#include <iostream>

/*
Session gate
============

Authentication (is this request signed in, and as whom?) is answered by the
trusted session cookie alone. Every protected handler calls this first and
uses *out_user_id as the acting user.

Fail-closed:
- no cookie, bad MAC, expired         -> 401 unauthenticated
- valid cookie for a deleted account  -> 401 unauthenticated
- cookie store failure                -> 500 try_again
*/

static void reply_401(httplib::Response& res) {
    res.status = 401;
    res.set_header("Cache-Control", "no-store");
    res.set_content(nlohmann::json({{"ok", false}, {"error", "unauthenticated"}}).dump(),
                    "application/json");
}

bool require_user_session(const httplib::Request& req,
                          httplib::Response& res,
                          const rcauth::SessionCookieManager& sessions,
                          const rcauth::UsersRegistry* users,
                          std::string* out_user_id) {
    // Read-only jar: the gate never writes cookies.
    rcauth::HttplibCookieJar jar(req, nullptr);

    std::optional<std::string> uid;
    try {
        uid = sessions.read(jar);
    } catch (const rcauth::CookieStoreError& e) {
        std::cerr << "[authz] ERROR: cookie store: " << e.what() << std::endl;
        res.status = 500;
        res.set_header("Cache-Control", "no-store");
        res.set_content(nlohmann::json({{"ok", false}, {"error", "try_again"}}).dump(),
                        "application/json");
        return false;
    }

    if (!uid) {
        reply_401(res);
        return false;
    }

    if (users && !users->exists(*uid)) {
        reply_401(res);
        return false;
    }

    if (out_user_id) *out_user_id = *uid;
    return true;
}
