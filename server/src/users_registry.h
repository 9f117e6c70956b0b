#pragma once
#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rcauth {

struct UserRec {
    std::string id;               // opaque, [A-Za-z0-9_-]
    std::string username;         // e.g. "KindPanda427"
    std::string avatar_seed;
    std::string recovery_digest;  // keyed BLAKE2b hex of the canonical code
    std::string created_at;       // ISO-8601 UTC
    std::string last_seen;        // ISO-8601 UTC
};

struct NewUser {
    UserRec user;
    std::string recovery_code;    // canonical; returned once, never stored
};

class UsersRegistry {
public:
    explicit UsersRegistry(const std::array<unsigned char, 32>& pepper);

    // Missing file = empty registry (returns true).
    bool load(const std::string& path, std::string* err = nullptr);
    bool save(const std::string& path, std::string* err = nullptr) const;

    // Mint id, username, avatar seed and recovery code for a new account.
    // Returns nullopt if no free username was found after 10 attempts.
    // Throws std::runtime_error if the random source is unavailable.
    std::optional<NewUser> create_user(const std::string& now_iso);

    // `canonical` must come from recovery_code_normalize().
    std::optional<UserRec> find_by_recovery_code(const std::string& canonical) const;

    std::optional<UserRec> get(const std::string& id) const;
    bool exists(const std::string& id) const;
    bool touch_last_seen(const std::string& id, const std::string& now_iso);
    bool erase(const std::string& id);
    std::size_t size() const;

private:
    std::string digest_(const std::string& canonical) const;

    std::array<unsigned char, 32> pepper_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, UserRec> by_id_;
    std::unordered_map<std::string, std::string> id_by_digest_;
    std::unordered_map<std::string, std::string> id_by_username_;
};

} // namespace rcauth
