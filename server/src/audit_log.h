#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace rcauth {

// Ordering: DEBUG < INFO < ADMIN < SECURITY
enum class AuditLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    ADMIN    = 2,
    SECURITY = 3,
};

/*
AuditEvent
==========

One security-relevant event, written as one JSONL line.

Never put recovery codes, cookie values, keys or digests in here. Log user
ids, outcomes and short reason codes only.
*/
struct AuditEvent {
    // ISO-8601 UTC, filled by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g. "auth.login_ok", "session.cookie_set"
    std::string event;

    // "ok" | "fail" | "deny"
    std::string outcome;

    AuditLevel level = AuditLevel::SECURITY;

    // Flat string -> string context (user_id, reason, ip, ...).
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL log:

  line_hash_i = SHA256( line_hash_{i-1} || json_i_without_line_hash )

The last committed hash is kept in memory and mirrored to a small state file
so a restart does not re-read the log. If the state file cannot be written
the chain itself stays intact; verify_chain() then reports the stale state
file. Editing, inserting, dropping or reordering lines breaks the
chain from that point on, which verify_chain() reports. This is tamper
evidence only: whoever can rewrite both files can rewrite history.

The log is the process's structured logger. It is constructed once in main()
and handed to components by pointer; nothing reaches it through a global.
*/
class AuditLog {
public:
    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe. Events below the minimum level are dropped. String values
    // are forced to well-formed UTF-8 (ill-formed bytes become U+FFFD) so
    // every line re-parses to exactly what was hashed.
    void append(const AuditEvent& e);

    // Accepts "DEBUG" | "INFO" | "ADMIN" | "SECURITY" (case-insensitive).
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;
    bool enabled(AuditLevel lvl) const;

    // Re-walk the log and check every prev_hash/line_hash link and the state
    // file. On failure `err` names the first bad line.
    bool verify_chain(std::string* err) const;

    const std::string& jsonl_path() const { return jsonl_path_; }

    static std::string sha256_hex(const std::string& s);

private:
    std::atomic<int> min_level_{static_cast<int>(AuditLevel::INFO)};

    std::string jsonl_path_;
    std::string state_path_;

    // Serializes appends so the chain stays linear.
    mutable std::mutex mu_;

    // Chain head; loaded from the state file on first append.
    std::string head_;
    bool head_loaded_ = false;

    std::string load_prev_hash_() const;
    bool store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Serialize e with prev_hash; when line_hash is non-null it is included.
    static std::string serialize_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  const std::string* line_hash);
};

} // namespace rcauth
