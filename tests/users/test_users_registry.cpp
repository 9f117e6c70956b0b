// tests/users/test_users_registry.cpp
//
// Users registry regression test.
//
// What it tests:
// 1) create_user mints a well-formed id, username and canonical code
// 2) find_by_recovery_code matches only the right account
// 3) the raw code is never written to users.json
// 4) save/load keeps accounts and their digests; a missing file is empty
// 5) a different pepper cannot find any account
//
// Build target should link users_registry.cpp + recovery_code.cc + rcauth_util.cc
// + session_cookie.cc.

#include <sodium.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <unistd.h>

#include "recovery_code.h"
#include "session_cookie.h"
#include "users_registry.h"

using rcauth::UsersRegistry;

static int failures = 0;

static void expect(bool cond, const char* name, const std::string& detail = "") {
    if (cond) return;
    std::fprintf(stderr, "[%s] FAIL%s%s\n", name, detail.empty() ? "" : ": ", detail.c_str());
    failures++;
}

static std::array<unsigned char, 32> pepper(unsigned char seed) {
    std::array<unsigned char, 32> p{};
    for (size_t i = 0; i < p.size(); i++) p[i] = (unsigned char)(seed + i);
    return p;
}

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static const char* kNow = "2030-01-01T00:00:00Z";

static void test_create_and_find() {
    UsersRegistry reg(pepper(7));

    auto a = reg.create_user(kNow);
    auto b = reg.create_user(kNow);
    if (!a || !b) {
        expect(false, "create_user");
        return;
    }

    expect(rcauth::user_id_well_formed(a->user.id), "create_id_well_formed", a->user.id);
    expect(a->user.id.rfind("u_", 0) == 0, "create_id_prefix", a->user.id);
    expect(a->user.id != b->user.id, "create_distinct_ids");
    expect(!a->user.username.empty(), "create_username");
    expect(a->user.username != b->user.username, "create_distinct_usernames");
    expect(!a->user.avatar_seed.empty(), "create_avatar_seed");
    expect(a->user.created_at == kNow, "create_created_at", a->user.created_at);
    expect(rcauth::recovery_code_is_valid(a->recovery_code), "create_code_canonical", a->recovery_code);
    expect(a->recovery_code != b->recovery_code, "create_distinct_codes");
    expect(a->user.recovery_digest.size() == 64, "create_digest_len");
    expect(a->user.recovery_digest.find(a->recovery_code) == std::string::npos, "create_digest_not_code");
    expect(reg.size() == 2, "create_size", std::to_string(reg.size()));

    auto hit = reg.find_by_recovery_code(a->recovery_code);
    expect(hit && hit->id == a->user.id, "find_by_code", hit ? hit->id : "<none>");

    auto hit_b = reg.find_by_recovery_code(b->recovery_code);
    expect(hit_b && hit_b->id == b->user.id, "find_by_code_b");

    // User-entered variants reach the same account through normalize().
    std::string sloppy = a->recovery_code;
    for (auto& c : sloppy) c = (char)std::tolower((unsigned char)c);
    auto canon = rcauth::recovery_code_normalize(sloppy);
    expect(canon && reg.find_by_recovery_code(*canon).has_value(), "find_after_normalize", sloppy);

    // Non-canonical input is not looked up at all.
    expect(!reg.find_by_recovery_code(sloppy), "find_requires_canonical");
    expect(!reg.find_by_recovery_code("AB2C-XY73-MN89"), "find_unknown_code");

    expect(reg.touch_last_seen(a->user.id, "2030-02-01T00:00:00Z"), "touch_last_seen");
    expect(reg.get(a->user.id)->last_seen == "2030-02-01T00:00:00Z", "touch_last_seen_value");
    expect(!reg.touch_last_seen("u_missing", kNow), "touch_missing");

    expect(reg.erase(b->user.id), "erase");
    expect(!reg.exists(b->user.id), "erase_gone");
    expect(!reg.find_by_recovery_code(b->recovery_code), "erase_code_gone");
    expect(!reg.erase(b->user.id), "erase_twice");
}

static void test_persistence() {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("rcauth_users_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    const std::string path = (dir / "data" / "users.json").string();

    {
        UsersRegistry fresh(pepper(7));
        std::string err;
        expect(fresh.load(path, &err), "load_missing_ok", err);
        expect(fresh.size() == 0, "load_missing_empty");
    }

    std::string code, id, username;
    {
        UsersRegistry reg(pepper(7));
        auto nu = reg.create_user(kNow);
        if (!nu) {
            expect(false, "persist_create");
            return;
        }
        code = nu->recovery_code;
        id = nu->user.id;
        username = nu->user.username;

        std::string err;
        expect(reg.save(path, &err), "save_ok", err);
    }

    const std::string on_disk = slurp(path);
    expect(on_disk.find(id) != std::string::npos, "save_has_id");
    expect(on_disk.find(code) == std::string::npos, "save_no_raw_code");
    std::string compact;
    for (char c : code) if (c != '-') compact.push_back(c);
    expect(on_disk.find(compact) == std::string::npos, "save_no_compact_code");

    {
        UsersRegistry reg(pepper(7));
        std::string err;
        expect(reg.load(path, &err), "reload_ok", err);
        expect(reg.size() == 1, "reload_size");
        auto u = reg.find_by_recovery_code(code);
        expect(u && u->id == id && u->username == username, "reload_find_by_code");
    }

    {
        UsersRegistry other(pepper(99));
        std::string err;
        expect(other.load(path, &err), "reload_other_pepper_ok", err);
        expect(!other.find_by_recovery_code(code), "other_pepper_no_match");
    }

    {
        std::ofstream bad(path, std::ios::trunc);
        bad << "{ not json";
    }
    {
        UsersRegistry reg(pepper(7));
        std::string err;
        expect(!reg.load(path, &err), "load_corrupt_fails");
        expect(!err.empty(), "load_corrupt_reason");
    }

    std::filesystem::remove_all(dir);
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 2;
    }

    test_create_and_find();
    test_persistence();

    if (failures) {
        std::fprintf(stderr, "[users_registry] FAILURES: %d\n", failures);
        return 1;
    }

    std::printf("[users_registry] ALL OK\n");
    return 0;
}
