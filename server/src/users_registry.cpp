#include "users_registry.h"

#include <sodium.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <unistd.h>

#include "recovery_code.h"
#include "rcauth_util.h"
#include "session_cookie.h"

using json = nlohmann::json;

namespace rcauth {

/*
================================================================================
Users Registry
================================================================================

JSON file of user accounts, held in memory behind one mutex.

The registry never sees a raw recovery code after create_user() returns it:
only the keyed digest (recovery_code_digest_hex with the server pepper) is
kept and persisted. A leaked users.json without the pepper does not let an
attacker test codes offline.

Indexes:
  by_id_          primary
  id_by_digest_   login lookup
  id_by_username_ uniqueness of generated usernames

File format:
  { "users": [ { "id", "username", "avatar_seed", "recovery_digest",
                 "created_at", "last_seen" }, ... ] }

save() writes a temp file in the same directory and renames it over the
target, so readers see either the old or the new file.
================================================================================
*/

static const char* const kAdjectives[] = {
    "Happy", "Kind", "Brave", "Gentle", "Cheerful", "Bright", "Caring", "Helpful"};
static const char* const kAnimals[] = {
    "Panda", "Fox", "Otter", "Bear", "Owl", "Deer", "Wolf", "Tiger"};

static constexpr int kMaxUsernameAttempts = 10;

// [Adjective][Animal][100-999], e.g. KindPanda427
static std::string generate_username() {
    const auto na = (uint32_t)(sizeof(kAdjectives) / sizeof(kAdjectives[0]));
    const auto nn = (uint32_t)(sizeof(kAnimals) / sizeof(kAnimals[0]));
    return std::string(kAdjectives[randombytes_uniform(na)])
         + kAnimals[randombytes_uniform(nn)]
         + std::to_string(100 + randombytes_uniform(900));
}

UsersRegistry::UsersRegistry(const std::array<unsigned char, 32>& pepper)
    : pepper_(pepper) {}

std::string UsersRegistry::digest_(const std::string& canonical) const {
    return recovery_code_digest_hex(pepper_.data(), canonical);
}

//------------------------------------------------------------------------------
// Persistence
//------------------------------------------------------------------------------

bool UsersRegistry::load(const std::string& path, std::string* err) {
    std::lock_guard<std::mutex> lk(mu_);
    by_id_.clear();
    id_by_digest_.clear();
    id_by_username_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return true; // fresh install

    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        if (err) *err = std::string("bad json: ") + e.what();
        return false;
    }
    if (!j.is_object() || !j.contains("users") || !j["users"].is_array()) {
        if (err) *err = "missing users array";
        return false;
    }

    for (auto& it : j["users"]) {
        if (!it.is_object()) continue;

        UserRec u;
        u.id              = it.value("id", "");
        u.username        = it.value("username", "");
        u.avatar_seed     = it.value("avatar_seed", "");
        u.recovery_digest = it.value("recovery_digest", "");
        u.created_at      = it.value("created_at", "");
        u.last_seen       = it.value("last_seen", "");

        // Records that could never be issued a session are skipped.
        if (!user_id_well_formed(u.id)) continue;

        if (!u.recovery_digest.empty()) id_by_digest_[u.recovery_digest] = u.id;
        if (!u.username.empty()) id_by_username_[u.username] = u.id;
        by_id_[u.id] = u;
    }

    return true;
}

bool UsersRegistry::save(const std::string& path, std::string* err) const {
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<std::string> keys;
    keys.reserve(by_id_.size());
    for (const auto& kv : by_id_) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    json j;
    j["users"] = json::array();
    for (const auto& k : keys) {
        const auto& u = by_id_.at(k);
        j["users"].push_back(json{
            {"id", u.id},
            {"username", u.username},
            {"avatar_seed", u.avatar_seed},
            {"recovery_digest", u.recovery_digest},
            {"created_at", u.created_at},
            {"last_seen", u.last_seen}
        });
    }

    std::filesystem::path p(path);
    std::error_code ec;

    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories: " + ec.message();
            return false;
        }
    }

    std::filesystem::path tmp = p;
    tmp += ".tmp.";
    tmp += std::to_string(::getpid());
    tmp += ".";
    tmp += std::to_string(static_cast<long long>(std::time(nullptr)));

    {
        std::ofstream out(tmp.string(), std::ios::trunc);
        if (!out.good()) {
            if (err) *err = "cannot write " + tmp.string();
            return false;
        }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            std::filesystem::remove(tmp, ec);
            if (err) *err = "short write " + tmp.string();
            return false;
        }
    }

    ec.clear();
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        if (err) *err = "rename: " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------
// Account creation
//------------------------------------------------------------------------------

std::optional<NewUser> UsersRegistry::create_user(const std::string& now_iso) {
    NewUser nu;
    nu.user.id = "u_" + random_hex(12);
    nu.user.avatar_seed = random_b64url(12);
    nu.user.created_at = now_iso;
    nu.user.last_seen = now_iso;

    std::lock_guard<std::mutex> lk(mu_);

    // 12 symbols over 31 characters is ~59 bits; a digest clash is not a
    // realistic event, but it would hand one user another user's session.
    do {
        nu.recovery_code = recovery_code_generate();
        nu.user.recovery_digest = digest_(nu.recovery_code);
    } while (id_by_digest_.count(nu.user.recovery_digest) != 0);

    for (int attempt = 0; attempt < kMaxUsernameAttempts; attempt++) {
        const std::string name = generate_username();
        if (id_by_username_.count(name)) continue;

        nu.user.username = name;
        by_id_[nu.user.id] = nu.user;
        id_by_digest_[nu.user.recovery_digest] = nu.user.id;
        id_by_username_[name] = nu.user.id;
        return nu;
    }

    return std::nullopt;
}

//------------------------------------------------------------------------------
// Lookups
//------------------------------------------------------------------------------

std::optional<UserRec> UsersRegistry::find_by_recovery_code(const std::string& canonical) const {
    if (!recovery_code_is_valid(canonical)) return std::nullopt;
    const std::string d = digest_(canonical);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = id_by_digest_.find(d);
    if (it == id_by_digest_.end()) return std::nullopt;

    auto u = by_id_.find(it->second);
    if (u == by_id_.end()) return std::nullopt;
    if (!recovery_digest_equal(u->second.recovery_digest, d)) return std::nullopt;
    return u->second;
}

std::optional<UserRec> UsersRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

bool UsersRegistry::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_id_.find(id) != by_id_.end();
}

bool UsersRegistry::touch_last_seen(const std::string& id, const std::string& now_iso) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    it->second.last_seen = now_iso;
    return true;
}

bool UsersRegistry::erase(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    id_by_digest_.erase(it->second.recovery_digest);
    id_by_username_.erase(it->second.username);
    by_id_.erase(it);
    return true;
}

std::size_t UsersRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_id_.size();
}

} // namespace rcauth
