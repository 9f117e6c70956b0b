#include "cookie_jar.h"

#include <cctype>

namespace rcauth {

static std::string trim_ws(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

std::string build_set_cookie(const std::string& name,
                             const std::string& value,
                             const CookieAttrs& attrs) {
    std::string c = name + "=" + value;
    c += "; Path=" + attrs.path;
    c += "; Max-Age=" + std::to_string(attrs.max_age < 0 ? 0 : attrs.max_age);
    if (!attrs.same_site.empty()) c += "; SameSite=" + attrs.same_site;
    if (attrs.http_only) c += "; HttpOnly";
    if (attrs.secure) c += "; Secure";
    return c;
}

/*
Cookie header parsing.

Pairs are split on ';' and matched by exact name. A plain substring search
for "name=" would let "x_rcauth_session" answer a lookup for "rcauth_session".
*/
std::map<std::string, std::string> parse_cookie_header(const std::string& hdr) {
    std::map<std::string, std::string> out;
    size_t pos = 0;
    while (pos <= hdr.size()) {
        size_t end = hdr.find(';', pos);
        if (end == std::string::npos) end = hdr.size();

        const std::string pair = trim_ws(hdr.substr(pos, end - pos));
        const size_t eq = pair.find('=');
        if (eq != std::string::npos && eq > 0) {
            out[trim_ws(pair.substr(0, eq))] = trim_ws(pair.substr(eq + 1));
        }
        pos = end + 1;
    }
    return out;
}

// -----------------------------------------------------------------------------
// HttplibCookieJar
// -----------------------------------------------------------------------------

HttplibCookieJar::HttplibCookieJar(const httplib::Request& req, httplib::Response* res)
    : req_(req), res_(res) {
    // Browsers send one Cookie header, but proxies may split it.
    auto range = req_.headers.equal_range("Cookie");
    for (auto it = range.first; it != range.second; ++it) {
        for (auto& kv : parse_cookie_header(it->second)) request_cookies_[kv.first] = kv.second;
    }
}

std::optional<std::string> HttplibCookieJar::get(const std::string& name) const {
    auto p = pending_.find(name);
    if (p != pending_.end()) return p->second;

    auto it = request_cookies_.find(name);
    if (it == request_cookies_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

void HttplibCookieJar::set(const std::string& name,
                           const std::string& value,
                           const CookieAttrs& attrs) {
    if (!res_) throw CookieStoreError("cookie store is read-only for this request");
    if (committed_) throw CookieStoreError("response already committed");

    res_->set_header("Set-Cookie", build_set_cookie(name, value, attrs));

    if (attrs.max_age <= 0 || value.empty()) pending_[name] = std::nullopt;
    else pending_[name] = value;
}

// -----------------------------------------------------------------------------
// MemoryCookieJar
// -----------------------------------------------------------------------------

std::optional<std::string> MemoryCookieJar::get(const std::string& name) const {
    auto it = cookies_.find(name);
    if (it == cookies_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

void MemoryCookieJar::set(const std::string& name,
                          const std::string& value,
                          const CookieAttrs& attrs) {
    if (read_only_) throw CookieStoreError("cookie store is read-only");

    lines_.push_back(build_set_cookie(name, value, attrs));
    if (attrs.max_age <= 0 || value.empty()) cookies_.erase(name);
    else cookies_[name] = value;
}

} // namespace rcauth
