#include "routes_auth.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

#include "advisory_cookie.h"
#include "audit_fields.h"
#include "audit_log.h"
#include "authz.h"
#include "cookie_jar.h"
#include "recovery_code.h"
#include "session_cookie.h"
#include "users_registry.h"

using json = nlohmann::json;

/*
Auth routes
===========

Error contract (what the client sees):
- 400 invalid_format : input is not 12 alphabet symbols in any spacing/case
- 401 invalid_code   : well-formed code that matches no account
- 500 try_again      : registry, random source or cookie store failure

Format errors are something the client can check locally anyway; a no-match
answer says nothing about how close the code was. Internal causes go to the
audit log and stderr only.

Ordering: on success the session cookie is set on the response (issue()
returned) before the success body is written.
*/

static void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body.dump(), "application/json");
}

static void reply_try_again(httplib::Response& res) {
    reply_json(res, 500, json{{"ok", false}, {"error", "try_again"},
                              {"message", "Something went wrong. Please try again."}});
}

static void audit_event(const AuthRoutesContext& ctx,
                        const httplib::Request& req,
                        const std::string& event,
                        const std::string& outcome,
                        std::map<std::string, std::string> f = {}) {
    if (!ctx.audit) return;
    rcauth::AuditEvent ev;
    ev.event = event;
    ev.outcome = outcome;
    ev.f = std::move(f);
    rcauth::add_client_fields(req, ev.f);
    ctx.audit->append(ev);
}

static void set_advisory_mirror(const AuthRoutesContext& ctx,
                                rcauth::CookieJar& jar,
                                const std::string& user_id) {
    const auto& sc = ctx.sessions->config();
    jar.set(rcauth::kAdvisoryCookieName, user_id,
            rcauth::advisory_cookie_attrs(sc.max_age_sec, sc.production));
}

// -----------------------------------------------------------------------------
// signup
// -----------------------------------------------------------------------------

void handle_signup(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    rcauth::HttplibCookieJar jar(req, &res);

    std::string user_id;
    try {
        auto nu = ctx.users->create_user(ctx.now_iso_utc());
        if (!nu) {
            audit_event(ctx, req, "auth.signup", "fail", {{"reason", "username_exhausted"}});
            reply_try_again(res);
            return;
        }
        user_id = nu->user.id;

        std::string err;
        if (ctx.users_path && !ctx.users->save(*ctx.users_path, &err)) {
            std::cerr << "[users] ERROR: save failed: " << err << std::endl;
            ctx.users->erase(user_id);
            audit_event(ctx, req, "auth.signup", "fail", {{"reason", "persist_failed"}});
            reply_try_again(res);
            return;
        }

        ctx.sessions->issue(jar, user_id);
        set_advisory_mirror(ctx, jar, user_id);

        audit_event(ctx, req, "auth.signup", "ok",
                    {{"user_id", user_id}, {"username", nu->user.username}});

        // The only time the code leaves the server.
        reply_json(res, 200, json{{"ok", true},
                                  {"user_id", user_id},
                                  {"username", nu->user.username},
                                  {"recovery_code", nu->recovery_code}});
        jar.commit();
    } catch (const std::exception& e) {
        std::cerr << "[auth] ERROR: signup: " << e.what() << std::endl;
        // Roll back an account whose code the user never saw.
        if (!user_id.empty() && ctx.users->erase(user_id) && ctx.users_path) {
            std::string err;
            if (!ctx.users->save(*ctx.users_path, &err))
                std::cerr << "[users] ERROR: rollback save failed: " << err << std::endl;
        }
        audit_event(ctx, req, "auth.signup", "fail", {{"reason", "exception"}});
        res.headers.erase("Set-Cookie");
        reply_try_again(res);
    }
}

// -----------------------------------------------------------------------------
// login
// -----------------------------------------------------------------------------

void handle_login(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    std::string code;
    try {
        const json body = json::parse(req.body);
        if (!body.is_object() || !body.contains("code") || !body["code"].is_string()) {
            reply_json(res, 400, json{{"ok", false}, {"error", "bad_request"}});
            return;
        }
        code = body["code"].get<std::string>();
    } catch (const json::exception&) {
        reply_json(res, 400, json{{"ok", false}, {"error", "bad_request"}});
        return;
    }

    const auto canonical = rcauth::recovery_code_normalize(code);
    if (!canonical) {
        audit_event(ctx, req, "auth.login_fail", "fail", {{"reason", "bad_format"}});
        reply_json(res, 400, json{{"ok", false}, {"error", "invalid_format"},
                                  {"message", "Recovery codes look like XXXX-XXXX-XXXX."}});
        return;
    }

    rcauth::HttplibCookieJar jar(req, &res);
    try {
        const auto user = ctx.users->find_by_recovery_code(*canonical);
        if (!user) {
            audit_event(ctx, req, "auth.login_fail", "fail", {{"reason", "no_match"}});
            reply_json(res, 401, json{{"ok", false}, {"error", "invalid_code"},
                                      {"message", "Invalid recovery code."}});
            return;
        }

        ctx.sessions->issue(jar, user->id);
        set_advisory_mirror(ctx, jar, user->id);

        ctx.users->touch_last_seen(user->id, ctx.now_iso_utc());
        std::string err;
        if (ctx.users_path && !ctx.users->save(*ctx.users_path, &err)) {
            // last_seen is cosmetic; the login itself stands.
            std::cerr << "[users] WARNING: save after login failed: " << err << std::endl;
        }

        audit_event(ctx, req, "auth.login_ok", "ok", {{"user_id", user->id}});
        reply_json(res, 200, json{{"ok", true},
                                  {"user_id", user->id},
                                  {"username", user->username}});
        jar.commit();
    } catch (const std::exception& e) {
        std::cerr << "[auth] ERROR: login: " << e.what() << std::endl;
        audit_event(ctx, req, "auth.login_fail", "fail", {{"reason", "exception"}});
        res.headers.erase("Set-Cookie");
        reply_try_again(res);
    }
}

// -----------------------------------------------------------------------------
// logout / me / format
// -----------------------------------------------------------------------------

void handle_logout(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    rcauth::HttplibCookieJar jar(req, &res);
    try {
        const auto uid = ctx.sessions->read(jar);
        ctx.sessions->clear(jar);
        jar.set(rcauth::kAdvisoryCookieName, "",
                rcauth::advisory_cookie_attrs(0, ctx.sessions->config().production));

        audit_event(ctx, req, "auth.logout", "ok", {{"user_id", uid.value_or("")}});
        reply_json(res, 200, json{{"ok", true}});
        jar.commit();
    } catch (const std::exception& e) {
        std::cerr << "[auth] ERROR: logout: " << e.what() << std::endl;
        reply_try_again(res);
    }
}

void handle_me(const AuthRoutesContext& ctx, const httplib::Request& req, httplib::Response& res) {
    std::string uid;
    if (!require_user_session(req, res, *ctx.sessions, ctx.users, &uid)) return;

    const auto u = ctx.users->get(uid);
    if (!u) {
        reply_json(res, 401, json{{"ok", false}, {"error", "unauthenticated"}});
        return;
    }

    reply_json(res, 200, json{{"ok", true},
                              {"user_id", u->id},
                              {"username", u->username},
                              {"avatar_seed", u->avatar_seed},
                              {"created_at", u->created_at}});
}

// Codes travel in the body, never the query string, so they stay out of
// proxy and access logs.
void handle_format(const AuthRoutesContext& /*ctx*/, const httplib::Request& req, httplib::Response& res) {
    std::string code;
    try {
        const json body = json::parse(req.body);
        if (body.is_object() && body.contains("code") && body["code"].is_string())
            code = body["code"].get<std::string>();
    } catch (const json::exception&) {
        reply_json(res, 400, json{{"ok", false}, {"error", "bad_request"}});
        return;
    }

    const auto canonical = rcauth::recovery_code_normalize(code);
    if (!canonical) {
        reply_json(res, 200, json{{"ok", false}});
        return;
    }
    reply_json(res, 200, json{{"ok", true}, {"canonical", *canonical}});
}

void register_auth_routes(httplib::Server& srv, const AuthRoutesContext& ctx) {
    srv.Post("/api/auth/signup", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_signup(ctx, req, res);
    });
    srv.Post("/api/auth/login", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_login(ctx, req, res);
    });
    srv.Post("/api/auth/logout", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_logout(ctx, req, res);
    });
    srv.Get("/api/auth/me", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_me(ctx, req, res);
    });
    srv.Post("/api/auth/format", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_format(ctx, req, res);
    });
}
