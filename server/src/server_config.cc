#include "server_config.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "rcauth_util.h"

using json = nlohmann::json;

namespace rcauth {

static bool parse_long(const char* s, long lo, long hi, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (*end != '\0' || v < lo || v > hi) return false;
    out = v;
    return true;
}

bool load_server_config_from_env(ServerConfig& cfg, const std::string& base_dir, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };

    if (!load_env_key("RCAUTH_COOKIE_KEY_B64URL", cfg.cookie_key.data(), cfg.cookie_key.size()))
        return fail("RCAUTH_COOKIE_KEY_B64URL missing or not 32 bytes base64url");
    if (!load_env_key("RCAUTH_CODE_PEPPER_B64URL", cfg.code_pepper.data(), cfg.code_pepper.size()))
        return fail("RCAUTH_CODE_PEPPER_B64URL missing or not 32 bytes base64url");

    if (const char* v = std::getenv("RCAUTH_ORIGIN")) cfg.origin = v;
    cfg.production = (cfg.origin.rfind("https://", 0) == 0);

    if (const char* v = std::getenv("RCAUTH_PRODUCTION")) {
        const std::string s = v;
        if (s == "1" || s == "true") cfg.production = true;
        else if (s == "0" || s == "false") cfg.production = false;
        else return fail("RCAUTH_PRODUCTION must be 0|1");
    }

    if (const char* v = std::getenv("RCAUTH_LISTEN_PORT")) {
        long port = 0;
        if (!parse_long(v, 1, 65535, port)) return fail("RCAUTH_LISTEN_PORT out of range");
        cfg.listen_port = (int)port;
    }
    if (const char* v = std::getenv("RCAUTH_SESS_TTL")) {
        if (!parse_long(v, 60, 60L * 60 * 24 * 400, cfg.sess_ttl)) return fail("RCAUTH_SESS_TTL out of range");
    }

    const std::filesystem::path base(base_dir);
    cfg.users_path = (base / "data" / "users.json").string();
    cfg.audit_dir = (base / "audit").string();
    cfg.settings_path = (base / "config" / "settings.json").string();

    if (const char* v = std::getenv("RCAUTH_USERS_PATH")) cfg.users_path = v;
    if (const char* v = std::getenv("RCAUTH_AUDIT_DIR")) cfg.audit_dir = v;
    if (const char* v = std::getenv("RCAUTH_SETTINGS_PATH")) cfg.settings_path = v;

    return true;
}

bool apply_settings_file(ServerConfig& cfg, std::string* err) {
    std::ifstream f(cfg.settings_path);
    if (!f.good()) return true;

    try {
        json j;
        f >> j;
        if (!j.is_object()) {
            if (err) *err = "settings: top level must be an object";
            return false;
        }
        if (j.contains("audit_min_level")) {
            if (!j["audit_min_level"].is_string()) {
                if (err) *err = "settings: audit_min_level must be a string";
                return false;
            }
            cfg.audit_min_level = j["audit_min_level"].get<std::string>();
        }
    } catch (const std::exception& e) {
        if (err) *err = std::string("settings: ") + e.what();
        return false;
    }
    return true;
}

} // namespace rcauth
