#pragma once
#include <array>
#include <string>

namespace rcauth {

// Process configuration, assembled once in main() and passed down by
// reference. Components never read the environment themselves.
struct ServerConfig {
    std::string origin = "http://localhost:8080";
    bool production = false;     // Secure cookies; defaults to origin scheme
    int listen_port = 8080;
    long sess_ttl = 60L * 60 * 24 * 30;

    std::string users_path;
    std::string audit_dir;
    std::string settings_path;
    std::string audit_min_level = "INFO";

    std::array<unsigned char, 32> cookie_key{};
    std::array<unsigned char, 32> code_pepper{};
};

// Environment:
//   RCAUTH_COOKIE_KEY_B64URL   (required, 32 bytes)
//   RCAUTH_CODE_PEPPER_B64URL  (required, 32 bytes)
//   RCAUTH_ORIGIN, RCAUTH_PRODUCTION, RCAUTH_LISTEN_PORT, RCAUTH_SESS_TTL,
//   RCAUTH_USERS_PATH, RCAUTH_AUDIT_DIR, RCAUTH_SETTINGS_PATH
//
// base_dir supplies defaults for the data paths. Returns false with err set
// if a required key is missing or a value does not parse.
bool load_server_config_from_env(ServerConfig& cfg, const std::string& base_dir, std::string* err);

// Optional JSON settings file: { "audit_min_level": "INFO" }.
// A missing file is fine (returns true); a malformed one is not.
bool apply_settings_file(ServerConfig& cfg, std::string* err);

} // namespace rcauth
