#pragma once
#include <map>
#include <optional>
#include <string>

namespace rcauth {

/*
Advisory identity cookie (rcauth_uid_hint)
==========================================

WARNING: this cookie is written and readable by page script. Anyone can set
it to any value. It exists so a client can render "signed in" before the
server answers, and for nothing else.

Never authorize anything from it. Protected server code derives identity
from SessionCookieManager::read() (rcauth_session) only. The two cookies
have different names so one can never be mistaken for, or overwrite, the
other.
*/

inline constexpr const char* kAdvisoryCookieName = "rcauth_uid_hint";

// The script-visible cookie store of a client (document.cookie semantics):
// reading yields "a=1; b=2", writing takes one "name=value; attr..." line.
class ClientDocument {
public:
    virtual ~ClientDocument() = default;
    virtual std::string cookie() const = 0;
    virtual void set_cookie(const std::string& assignment) = 0;
};

struct CookieAttrs;

// Script-readable (no HttpOnly), SameSite=Strict, Path=/.
CookieAttrs advisory_cookie_attrs(long max_age, bool secure);

// Set-Cookie / document.cookie assignment for the advisory cookie.
std::string advisory_cookie_assignment(const std::string& user_id, long max_age, bool secure);

class AdvisoryCookie {
public:
    // doc == nullptr means there is no client context (e.g. server-side
    // rendering): every call is a no-op and get() returns nullopt.
    explicit AdvisoryCookie(ClientDocument* doc, bool secure = false);

    // Throws std::invalid_argument unless user_id_well_formed(user_id).
    void set(const std::string& user_id);
    std::optional<std::string> get() const;
    void clear();

private:
    ClientDocument* doc_;
    bool secure_;
};

/*
In-memory document.cookie, used by native/embedded clients and by tests.

absorb_set_cookie() takes a server Set-Cookie line the way a browser would:
HttpOnly cookies are stored but never appear in cookie().
*/
class MemoryClientDocument : public ClientDocument {
public:
    std::string cookie() const override;
    void set_cookie(const std::string& assignment) override;

    void absorb_set_cookie(const std::string& set_cookie_line);

    // Cookies the server would receive on the next request (HttpOnly included).
    std::string request_cookie_header() const;

private:
    void apply_(const std::string& line, bool from_script);

    std::map<std::string, std::string> script_visible_;
    std::map<std::string, std::string> http_only_;
};

} // namespace rcauth
