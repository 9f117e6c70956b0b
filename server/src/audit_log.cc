#include "audit_log.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include "rcauth_util.h"

using json = nlohmann::json;

namespace rcauth {

static const std::string kGenesis(64, '0');

static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

static const char* level_name(AuditLevel lvl) {
    switch (lvl) {
        case AuditLevel::DEBUG:    return "DEBUG";
        case AuditLevel::INFO:     return "INFO";
        case AuditLevel::ADMIN:    return "ADMIN";
        case AuditLevel::SECURITY: return "SECURITY";
    }
    return "SECURITY";
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
    : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
    std::string u;
    for (char c : s) u.push_back((char)std::toupper((unsigned char)c));

    AuditLevel lvl;
    if (u == "DEBUG") lvl = AuditLevel::DEBUG;
    else if (u == "INFO") lvl = AuditLevel::INFO;
    else if (u == "ADMIN") lvl = AuditLevel::ADMIN;
    else if (u == "SECURITY") lvl = AuditLevel::SECURITY;
    else return false;

    min_level_.store(static_cast<int>(lvl));
    return true;
}

std::string AuditLog::min_level_str() const {
    return level_name(static_cast<AuditLevel>(min_level_.load()));
}

bool AuditLog::enabled(AuditLevel lvl) const {
    return static_cast<int>(lvl) >= min_level_.load();
}

// Missing or damaged state starts a new chain from the all-zero hash.
std::string AuditLog::load_prev_hash_() const {
    std::ifstream f(state_path_);
    if (!f.good()) return kGenesis;
    std::string line;
    std::getline(f, line);
    if (line.size() != 64) return kGenesis;
    return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
    std::ofstream f(state_path_, std::ios::trunc);
    f << h << "\n";
    f.flush();
    return f.good();
}

std::string AuditLog::json_escape_(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '\"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << (int)(unsigned char)c << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

/*
Field order is part of the hash preimage:
  ts, level, event, outcome, prev_hash, [line_hash], [f]
verify_chain() rebuilds the preimage from the parsed line with the same
function, so both sides must go through serialize_().
*/
std::string AuditLog::serialize_(const AuditEvent& e,
                                 const std::string& prev_hash,
                                 const std::string* line_hash) {
    std::ostringstream js;
    js << "{"
       << "\"ts\":\"" << json_escape_(e.ts_utc) << "\""
       << ",\"level\":\"" << level_name(e.level) << "\""
       << ",\"event\":\"" << json_escape_(e.event) << "\""
       << ",\"outcome\":\"" << json_escape_(e.outcome) << "\""
       << ",\"prev_hash\":\"" << prev_hash << "\"";

    if (line_hash) js << ",\"line_hash\":\"" << *line_hash << "\"";

    if (!e.f.empty()) {
        js << ",\"f\":{";
        bool first = true;
        for (const auto& kv : e.f) {
            if (!first) js << ",";
            first = false;
            js << "\"" << json_escape_(kv.first) << "\":"
               << "\"" << json_escape_(kv.second) << "\"";
        }
        js << "}";
    }

    js << "}";
    return js.str();
}

void AuditLog::append(const AuditEvent& e_in) {
    if (!enabled(e_in.level)) return;

    std::lock_guard<std::mutex> lk(mu_);

    AuditEvent e = e_in;
    if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();
    e.ts_utc = utf8_sanitize(e.ts_utc);
    e.event = utf8_sanitize(e.event);
    e.outcome = utf8_sanitize(e.outcome);
    {
        std::map<std::string, std::string> clean;
        for (const auto& kv : e.f) clean[utf8_sanitize(kv.first)] = utf8_sanitize(kv.second);
        e.f = std::move(clean);
    }

    if (!head_loaded_) {
        head_ = load_prev_hash_();
        head_loaded_ = true;
    }
    const std::string prev = head_;
    const std::string line_hash = sha256_hex(prev + serialize_(e, prev, nullptr));

    std::ofstream out(jsonl_path_, std::ios::app);
    out << serialize_(e, prev, &line_hash) << "\n";
    out.flush();
    if (!out.good()) {
        // The chain head only moves when the line is on disk.
        std::cerr << "[audit] ERROR: append failed: " << jsonl_path_ << std::endl;
        return;
    }

    head_ = line_hash;
    if (!store_prev_hash_(line_hash)) {
        std::cerr << "[audit] ERROR: state write failed: " << state_path_ << std::endl;
    }
}

bool AuditLog::verify_chain(std::string* err) const {
    std::lock_guard<std::mutex> lk(mu_);

    std::ifstream in(jsonl_path_);
    std::string expect_prev = kGenesis;
    std::string line;
    size_t lineno = 0;

    auto fail = [&](const std::string& why) {
        if (err) *err = "line " + std::to_string(lineno) + ": " + why;
        return false;
    };

    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;

        json j;
        try {
            j = json::parse(line);
        } catch (const std::exception& ex) {
            return fail(std::string("bad json: ") + ex.what());
        }

        AuditEvent e;
        e.ts_utc  = j.value("ts", "");
        e.event   = j.value("event", "");
        e.outcome = j.value("outcome", "");

        const std::string lvl = j.value("level", "SECURITY");
        if (lvl == "DEBUG") e.level = AuditLevel::DEBUG;
        else if (lvl == "INFO") e.level = AuditLevel::INFO;
        else if (lvl == "ADMIN") e.level = AuditLevel::ADMIN;
        else e.level = AuditLevel::SECURITY;

        if (j.contains("f") && j["f"].is_object()) {
            for (auto it = j["f"].begin(); it != j["f"].end(); ++it) {
                if (!it.value().is_string()) return fail("non-string field");
                e.f[it.key()] = it.value().get<std::string>();
            }
        }

        const std::string prev = j.value("prev_hash", "");
        const std::string have = j.value("line_hash", "");
        if (prev != expect_prev) return fail("prev_hash mismatch");

        const std::string want = sha256_hex(prev + serialize_(e, prev, nullptr));
        if (want != have) return fail("line_hash mismatch");

        expect_prev = have;
    }

    if (lineno > 0 && load_prev_hash_() != expect_prev) {
        return fail("state file does not match last line");
    }
    return true;
}

} // namespace rcauth
