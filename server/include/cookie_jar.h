#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "httplib.h"

namespace rcauth {

// Raised when cookies cannot be written for the current request: the jar is
// read-only, or the response it belongs to was already committed.
class CookieStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CookieAttrs {
    bool http_only = true;
    bool secure = false;
    std::string same_site = "Strict";
    std::string path = "/";
    long max_age = 0;   // seconds; 0 deletes the cookie
};

// "name=value; Path=/; Max-Age=...; SameSite=Strict[; HttpOnly][; Secure]"
std::string build_set_cookie(const std::string& name,
                             const std::string& value,
                             const CookieAttrs& attrs);

// Split a Cookie request header into name -> value. Later duplicates lose.
std::map<std::string, std::string> parse_cookie_header(const std::string& hdr);

/*
CookieJar
=========

The cookie store of one request/response cycle. Reads see the request's
cookies, overlaid with anything set earlier in the same cycle; writes become
Set-Cookie headers on the response.

set() throws CookieStoreError when the store cannot take writes. Callers must
not treat a write as done unless set() returned normally.
*/
class CookieJar {
public:
    virtual ~CookieJar() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual void set(const std::string& name,
                     const std::string& value,
                     const CookieAttrs& attrs) = 0;
};

// Jar bound to a cpp-httplib request and (optionally) its response.
// With res == nullptr the jar is read-only.
class HttplibCookieJar : public CookieJar {
public:
    HttplibCookieJar(const httplib::Request& req, httplib::Response* res);

    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name,
             const std::string& value,
             const CookieAttrs& attrs) override;

    // After commit() the response headers are final and set() throws.
    void commit() { committed_ = true; }

private:
    const httplib::Request& req_;
    httplib::Response* res_;
    bool committed_ = false;

    std::map<std::string, std::string> request_cookies_;
    // name -> value set during this cycle (nullopt = deleted)
    std::map<std::string, std::optional<std::string>> pending_;
};

// Standalone jar; keeps the emitted Set-Cookie lines for inspection.
class MemoryCookieJar : public CookieJar {
public:
    MemoryCookieJar() = default;
    explicit MemoryCookieJar(std::map<std::string, std::string> initial)
        : cookies_(std::move(initial)) {}

    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name,
             const std::string& value,
             const CookieAttrs& attrs) override;

    void set_read_only(bool ro) { read_only_ = ro; }
    const std::vector<std::string>& set_cookie_lines() const { return lines_; }

private:
    std::map<std::string, std::string> cookies_;
    std::vector<std::string> lines_;
    bool read_only_ = false;
};

} // namespace rcauth
