/*
 * ToolGate C++ - URL validation (SSRF guard)
 *
 * Only http/https URLs whose host resolves exclusively to public addresses
 * are accepted. Parsing uses libcurl's URL API so the host we check is the
 * host curl would connect to.
 */
#ifndef toolgate_SAFETY_URLS_HPP
#define toolgate_SAFETY_URLS_HPP

#include <string>
#include <vector>
#include <functional>

namespace toolgate {

class Config;

struct UrlCheck {
    bool safe;
    std::string reason;
    std::string host;          // Hostname without IPv6 brackets
    std::string resolved_ip;   // First resolved address when safe

    UrlCheck() : safe(false) {}
};

// Resolve `host` into textual addresses. Returns false and fills `error`
// on failure.
typedef std::function<bool(const std::string& host, std::vector<std::string>& addrs,
                           std::string& error)> HostResolver;

// getaddrinfo(3) based resolver
HostResolver system_resolver();

struct UrlPolicy {
    // Exact names; an entry starting with "." matches any subdomain
    std::vector<std::string> internal_hostnames;

    static UrlPolicy defaults();

    // Defaults plus safety.internal_hostnames
    static UrlPolicy from_config(const Config& config);
};

// True for loopback, private, CGNAT, link-local, unspecified, multicast,
// broadcast and reserved addresses, including IPv4-mapped IPv6 forms.
// Anything that is not a valid IP literal is treated as internal.
bool is_internal_address(const std::string& ip);

bool is_internal_hostname(const std::string& host, const UrlPolicy& policy);

// An empty resolver means system_resolver().
UrlCheck validate_url(const std::string& url, const HostResolver& resolver = HostResolver());
UrlCheck validate_url(const std::string& url, const HostResolver& resolver,
                      const UrlPolicy& policy);

} // namespace toolgate

#endif // toolgate_SAFETY_URLS_HPP
