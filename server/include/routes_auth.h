#pragma once
#include "httplib.h"

#include <functional>
#include <string>

namespace rcauth {
class AuditLog;
class SessionCookieManager;
class UsersRegistry;
} // namespace rcauth

// Everything the auth routes need, owned by main.cpp. Handlers reach shared
// state only through this struct.
struct AuthRoutesContext {
    rcauth::SessionCookieManager* sessions = nullptr;
    rcauth::UsersRegistry* users = nullptr;
    rcauth::AuditLog* audit = nullptr;   // may be null

    const std::string* users_path = nullptr;

    std::function<std::string()> now_iso_utc;
};

// POST /api/auth/signup   -> {ok, user_id, username, recovery_code}
void handle_signup(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res);

// POST /api/auth/login    body {"code": "..."} -> {ok, user_id, username}
void handle_login(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res);

// POST /api/auth/logout   -> {ok}
void handle_logout(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res);

// GET  /api/auth/me       -> {ok, user_id, username, created_at} | 401
void handle_me(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res);

// POST /api/auth/format  body {"code": "..."} -> {ok:true, canonical} | {ok:false}
void handle_format(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res);

void register_auth_routes(httplib::Server& srv, const AuthRoutesContext& ctx);
