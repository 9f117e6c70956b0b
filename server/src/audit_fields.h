#pragma once
#include <map>
#include <string>

#include "httplib.h"
#include "rcauth_util.h"

namespace rcauth {

    // Only non-secret metadata goes into audit events.
    //
    // OK to log:
    //   - user_id, username
    //   - ip / user agent (shortened)
    //   - reason codes
    //
    // NOT OK:
    //   - recovery codes (raw or normalized), even partially
    //   - recovery digests
    //   - cookie values, keys, pepper

    // Header values are client bytes: cut on a UTF-8 boundary and replace
    // anything ill-formed, so the audit line stays parseable.
    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return utf8_sanitize(s);
        return utf8_sanitize(s.substr(0, utf8_prefix_len(s, maxlen))) + "...";
    }

    inline void add_client_fields(const httplib::Request& req,
                                  std::map<std::string, std::string>& f) {
        f["ip"] = req.remote_addr.empty() ? "?" : req.remote_addr;

        auto it_xff = req.headers.find("X-Forwarded-For");
        if (it_xff != req.headers.end()) f["xff"] = shorten(it_xff->second, 120);

        auto it_ua = req.headers.find("User-Agent");
        if (it_ua != req.headers.end()) f["ua"] = shorten(it_ua->second, 120);
    }

} // namespace rcauth
