// tests/audit/test_audit_log.cpp
//
// Audit log regression test.
//
// What it tests:
// 1) appended events form a chain that verify_chain() accepts
// 2) level filtering drops events below the minimum
// 3) editing, dropping or reordering a line is detected
// 4) client-supplied header bytes (cut UTF-8, ill-formed bytes) never make
//    an honest log fail verification
// 5) an unwritable state file is reported without breaking the chain
//
// Build target should link audit_log.cc + rcauth_util.cc.

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

#include "audit_fields.h"
#include "audit_log.h"
#include "rcauth_util.h"

using rcauth::AuditEvent;
using rcauth::AuditLevel;
using rcauth::AuditLog;

static int failures = 0;

static void expect(bool cond, const char* name, const std::string& detail = "") {
    if (cond) return;
    std::fprintf(stderr, "[%s] FAIL%s%s\n", name, detail.empty() ? "" : ": ", detail.c_str());
    failures++;
}

static std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream f(path, std::ios::trunc);
    for (const auto& l : lines) f << l << "\n";
}

static AuditEvent make_event(const std::string& event, AuditLevel lvl, const std::string& uid) {
    AuditEvent e;
    e.ts_utc = "2030-01-01T00:00:00Z";
    e.event = event;
    e.outcome = "ok";
    e.level = lvl;
    e.f["user_id"] = uid;
    e.f["ua"] = "quote\" backslash\\ newline\n";
    return e;
}

int main() {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("rcauth_audit_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const std::string log_path = (dir / "audit.jsonl").string();
    const std::string state_path = (dir / "audit.state").string();

    {
        AuditLog empty(log_path, state_path);
        std::string err;
        expect(empty.verify_chain(&err), "verify_empty", err);
    }

    AuditLog log(log_path, state_path);
    expect(log.min_level_str() == "INFO", "default_min_level", log.min_level_str());
    expect(!log.set_min_level_str("LOUD"), "reject_unknown_level");
    expect(log.set_min_level_str("info"), "accept_lowercase_level");

    log.append(make_event("auth.signup", AuditLevel::SECURITY, "u_1"));
    log.append(make_event("debug.noise", AuditLevel::DEBUG, "u_1"));
    log.append(make_event("auth.login_ok", AuditLevel::SECURITY, "u_1"));
    log.append(make_event("session.cookie_cleared", AuditLevel::INFO, "u_1"));

    std::vector<std::string> lines = read_lines(log_path);
    expect(lines.size() == 3, "debug_filtered", std::to_string(lines.size()));

    std::string err;
    expect(log.verify_chain(&err), "verify_ok", err);

    // Appending again continues from the stored head.
    {
        AuditLog reopened(log_path, state_path);
        reopened.append(make_event("auth.logout", AuditLevel::SECURITY, "u_1"));
        err.clear();
        expect(reopened.verify_chain(&err), "verify_after_reopen", err);
    }
    lines = read_lines(log_path);

    // Edit a field inside line 2.
    {
        std::vector<std::string> edited = lines;
        const auto pos = edited[1].find("u_1");
        edited[1].replace(pos, 3, "u_2");
        write_lines(log_path, edited);
        err.clear();
        expect(!log.verify_chain(&err), "detect_edit");
        expect(err.rfind("line 2", 0) == 0, "detect_edit_line", err);
    }

    // Drop a middle line.
    {
        std::vector<std::string> dropped = lines;
        dropped.erase(dropped.begin() + 1);
        write_lines(log_path, dropped);
        err.clear();
        expect(!log.verify_chain(&err), "detect_drop", err);
    }

    // Swap two lines.
    {
        std::vector<std::string> swapped = lines;
        std::swap(swapped[0], swapped[1]);
        write_lines(log_path, swapped);
        err.clear();
        expect(!log.verify_chain(&err), "detect_reorder");
    }

    // Truncate the tail: every line links, but the state file knows better.
    {
        std::vector<std::string> cut = lines;
        cut.pop_back();
        write_lines(log_path, cut);
        err.clear();
        expect(!log.verify_chain(&err), "detect_truncate", err);
    }

    write_lines(log_path, lines);
    err.clear();
    expect(log.verify_chain(&err), "verify_restored", err);

    // ---- client bytes ----
    {
        const std::string ua_log = (dir / "ua.jsonl").string();
        AuditLog ua(ua_log, (dir / "ua.state").string());

        // A two-byte character straddling the cut at 120.
        const std::string long_ua = std::string(119, 'x') + "\xC3\xA9tail";
        const std::string cut = rcauth::shorten(long_ua, 120);
        expect(cut == std::string(119, 'x') + "...", "shorten_utf8_boundary", cut);
        expect(rcauth::shorten("caf\xC3\xA9", 120) == "caf\xC3\xA9", "shorten_keeps_valid");

        AuditEvent e = make_event("auth.login_fail", AuditLevel::SECURITY, "u_1");
        e.f["ua"] = cut;
        ua.append(e);

        // Raw substr cut, stray bytes, a surrogate and an overlong slash.
        e.f["ua"] = long_ua.substr(0, 120);
        e.f["xff"] = "\xFF\xFE 10.0.0.1 \xED\xA0\x80 \xC0\xAF";
        ua.append(e);

        err.clear();
        expect(ua.verify_chain(&err), "verify_client_bytes", err);

        const std::vector<std::string> ua_lines = read_lines(ua_log);
        expect(ua_lines.size() == 2, "client_bytes_lines", std::to_string(ua_lines.size()));
        expect(ua_lines.size() == 2 && ua_lines[1].find("\xEF\xBF\xBD") != std::string::npos,
               "client_bytes_replacement_char");

        expect(rcauth::utf8_sanitize("ok \xE2\x82\xAC") == "ok \xE2\x82\xAC", "sanitize_keeps_euro");
        expect(rcauth::utf8_sanitize("\xC3") == "\xEF\xBF\xBD", "sanitize_truncated_seq");
        expect(rcauth::utf8_sanitize("\xF4\x90\x80\x80") ==
                   "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD",
               "sanitize_above_max_code_point");
    }

    // ---- state file cannot be written ----
    {
        const std::filesystem::path blocker = dir / "blocker";
        { std::ofstream f(blocker); f << "not a directory\n"; }

        const std::string st_log = (dir / "st.jsonl").string();
        AuditLog st(st_log, (blocker / "st.state").string());
        st.append(make_event("auth.signup", AuditLevel::SECURITY, "u_1"));
        st.append(make_event("auth.login_ok", AuditLevel::SECURITY, "u_1"));
        st.append(make_event("auth.logout", AuditLevel::SECURITY, "u_1"));

        // Lines still link to each other; only the state file is stale.
        err.clear();
        expect(!st.verify_chain(&err), "stale_state_reported");
        expect(err.find("state file") != std::string::npos, "stale_state_reason", err);
        expect(read_lines(st_log).size() == 3, "stale_state_lines_written");
    }

    expect(AuditLog::sha256_hex("abc") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
           "sha256_known_answer");

    std::filesystem::remove_all(dir);

    if (failures) {
        std::fprintf(stderr, "[audit_log] FAILURES: %d\n", failures);
        return 1;
    }

    std::printf("[audit_log] ALL OK\n");
    return 0;
}
