#pragma once

#include <string>

#include "httplib.h"

namespace rcauth {
class SessionCookieManager;
class UsersRegistry;
}

// Session-required gate for protected endpoints.
//
// Reads identity from the trusted session cookie only (never the advisory
// rcauth_uid_hint cookie). On failure writes a 401 JSON response and returns
// false. If users != nullptr the account must still exist.
bool require_user_session(const httplib::Request& req,
                          httplib::Response& res,
                          const rcauth::SessionCookieManager& sessions,
                          const rcauth::UsersRegistry* users,
                          std::string* out_user_id);
