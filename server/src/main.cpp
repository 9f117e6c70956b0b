/*
rcauth server
=============

Passwordless sign-in with recovery codes:
- POST /api/auth/signup mints an account and a one-time-displayed recovery
  code (XXXX-XXXX-XXXX). Only a keyed digest of the code is stored.
- POST /api/auth/login exchanges a code for an HMAC-signed, HttpOnly session
  cookie (rcauth_session, 30 days).
- Protected endpoints identify the caller from that cookie only. The
  script-readable rcauth_uid_hint cookie is a UI hint and never authorizes.

Not provided: passwords, MFA, federated login, login throttling.

Startup is fail-closed: missing keys or an unreadable users registry abort
before the listener opens.
*/

#include <sodium.h>

#include <filesystem>
#include <iostream>
#include <string>

#include "httplib.h"
#include <nlohmann/json.hpp>

#include "audit_log.h"
#include "rcauth_util.h"
#include "routes_auth.h"
#include "server_config.h"
#include "session_cookie.h"
#include "users_registry.h"

using json = nlohmann::json;

int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    rcauth::ServerConfig cfg;
    {
        std::string err;
        if (!rcauth::load_server_config_from_env(cfg, rcauth::exe_dir(), &err)) {
            std::cerr << "[config] FATAL: " << err << std::endl;
            std::cerr << "Run ./build/bin/rcauth_keygen > .env.rcauth then: source .env.rcauth" << std::endl;
            return 2;
        }
        if (!rcauth::apply_settings_file(cfg, &err)) {
            std::cerr << "[settings] FATAL: " << err << std::endl;
            return 2;
        }
    }

    // ---- Audit log (hash-chained JSONL) ----
    try {
        std::filesystem::create_directories(cfg.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    rcauth::AuditLog audit(cfg.audit_dir + "/rcauth_audit.jsonl",
                           cfg.audit_dir + "/rcauth_audit.state");
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[settings] WARNING: invalid audit_min_level '" << cfg.audit_min_level
                  << "', keeping " << audit.min_level_str() << std::endl;
    }
    std::cerr << "[settings] audit_min_level=" << audit.min_level_str() << std::endl;

    {
        std::string err;
        if (!audit.verify_chain(&err)) {
            // Evidence of tampering (or a crash mid-write); keep running, but loudly.
            std::cerr << "[audit] WARNING: chain verification failed: " << err << std::endl;
        }
    }

    // ---- Users registry ----
    rcauth::UsersRegistry users(cfg.code_pepper);
    {
        std::string err;
        if (!users.load(cfg.users_path, &err)) {
            std::cerr << "[users] FATAL: failed to load users registry: " << cfg.users_path
                      << " (" << err << ")" << std::endl;
            return 3;
        }
    }
    std::cerr << "[users] loaded " << users.size() << " users from " << cfg.users_path << std::endl;

    // ---- Sessions ----
    rcauth::SessionCookieConfig scfg;
    scfg.key = cfg.cookie_key;
    scfg.max_age_sec = cfg.sess_ttl;
    scfg.production = cfg.production;
    rcauth::SessionCookieManager sessions(scfg, &audit, &rcauth::now_epoch);

    if (!cfg.production) {
        std::cerr << "[session] NOTE: development mode, cookies are sent without Secure" << std::endl;
    }

    // ---- HTTP ----
    httplib::Server srv;

    AuthRoutesContext ctx;
    ctx.sessions = &sessions;
    ctx.users = &users;
    ctx.audit = &audit;
    ctx.users_path = &cfg.users_path;
    ctx.now_iso_utc = &rcauth::now_iso_utc;

    register_auth_routes(srv, ctx);

    srv.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Cache-Control", "no-store");
        res.set_content(json({{"ok", true}}).dump(), "application/json");
    });

    {
        rcauth::AuditEvent ev;
        ev.event = "server.start";
        ev.outcome = "ok";
        ev.level = rcauth::AuditLevel::ADMIN;
        ev.f["origin"] = cfg.origin;
        ev.f["production"] = cfg.production ? "true" : "false";
        ev.f["port"] = std::to_string(cfg.listen_port);
        audit.append(ev);
    }

    std::cerr << "rcauth server listening on 0.0.0.0:" << cfg.listen_port << std::endl;
    if (!srv.listen("0.0.0.0", cfg.listen_port)) {
        std::cerr << "[http] FATAL: listen failed on port " << cfg.listen_port << std::endl;
        return 4;
    }
    return 0;
}
