#include "advisory_cookie.h"

#include <cctype>
#include <stdexcept>

#include "cookie_jar.h"
#include "session_cookie.h"

namespace rcauth {

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string trim_ws(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

CookieAttrs advisory_cookie_attrs(long max_age, bool secure) {
    CookieAttrs a;
    a.http_only = false;
    a.secure = secure;
    a.same_site = "Strict";
    a.path = "/";
    a.max_age = max_age;
    return a;
}

std::string advisory_cookie_assignment(const std::string& user_id, long max_age, bool secure) {
    return build_set_cookie(kAdvisoryCookieName, user_id, advisory_cookie_attrs(max_age, secure));
}

// -----------------------------------------------------------------------------
// AdvisoryCookie
// -----------------------------------------------------------------------------

AdvisoryCookie::AdvisoryCookie(ClientDocument* doc, bool secure)
    : doc_(doc), secure_(secure) {}

void AdvisoryCookie::set(const std::string& user_id) {
    if (!doc_) return;
    // Same rule as the session cookie: no ';' to smuggle attributes, and an
    // empty value would silently delete the cookie.
    if (!user_id_well_formed(user_id)) {
        throw std::invalid_argument("advisory cookie: malformed user id");
    }
    doc_->set_cookie(advisory_cookie_assignment(user_id, kSessionMaxAgeSec, secure_));
}

std::optional<std::string> AdvisoryCookie::get() const {
    if (!doc_) return std::nullopt;
    auto cookies = parse_cookie_header(doc_->cookie());
    auto it = cookies.find(kAdvisoryCookieName);
    if (it == cookies.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

void AdvisoryCookie::clear() {
    if (!doc_) return;
    doc_->set_cookie(advisory_cookie_assignment("", 0, secure_));
}

// -----------------------------------------------------------------------------
// MemoryClientDocument
// -----------------------------------------------------------------------------

std::string MemoryClientDocument::cookie() const {
    std::string out;
    for (const auto& kv : script_visible_) {
        if (!out.empty()) out += "; ";
        out += kv.first + "=" + kv.second;
    }
    return out;
}

std::string MemoryClientDocument::request_cookie_header() const {
    std::map<std::string, std::string> all = script_visible_;
    for (const auto& kv : http_only_) all[kv.first] = kv.second;

    std::string out;
    for (const auto& kv : all) {
        if (!out.empty()) out += "; ";
        out += kv.first + "=" + kv.second;
    }
    return out;
}

void MemoryClientDocument::set_cookie(const std::string& assignment) {
    apply_(assignment, /*from_script=*/true);
}

void MemoryClientDocument::absorb_set_cookie(const std::string& set_cookie_line) {
    apply_(set_cookie_line, /*from_script=*/false);
}

void MemoryClientDocument::apply_(const std::string& line, bool from_script) {
    const size_t semi = line.find(';');
    const std::string pair = trim_ws(line.substr(0, semi));
    const size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) return;

    const std::string name = trim_ws(pair.substr(0, eq));
    const std::string value = trim_ws(pair.substr(eq + 1));

    bool http_only = false;
    bool expired = value.empty();
    size_t pos = semi;
    while (pos != std::string::npos) {
        size_t next = line.find(';', pos + 1);
        const std::string attr = lower_ascii(trim_ws(line.substr(pos + 1, next == std::string::npos
                                                                   ? std::string::npos
                                                                   : next - pos - 1)));
        if (attr == "httponly") http_only = true;
        if (attr.rfind("max-age=", 0) == 0) {
            const std::string n = attr.substr(8);
            if (n.empty() || n[0] == '-' || n == "0") expired = true;
        }
        pos = next;
    }

    // Script may not create or replace an HttpOnly cookie.
    if (from_script && (http_only || http_only_.count(name))) return;

    if (expired) {
        if (from_script) script_visible_.erase(name);
        else { script_visible_.erase(name); http_only_.erase(name); }
        return;
    }

    if (http_only) {
        script_visible_.erase(name);
        http_only_[name] = value;
    } else {
        http_only_.erase(name);
        script_visible_[name] = value;
    }
}

} // namespace rcauth
