/*
 * ToolGate C++ - URL validation
 */
#include <toolgate/safety/urls.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

#include <curl/curl.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <cstring>

namespace toolgate {

// ============================================================================
// Resolver
// ============================================================================

HostResolver system_resolver() {
    return [](const std::string& host, std::vector<std::string>& addrs, std::string& error) {
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        if (rc != 0) {
            error = gai_strerror(rc);
            return false;
        }

        char buf[INET6_ADDRSTRLEN];
        for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
            const void* src = nullptr;
            if (ai->ai_family == AF_INET) {
                src = &reinterpret_cast<struct sockaddr_in*>(ai->ai_addr)->sin_addr;
            } else if (ai->ai_family == AF_INET6) {
                src = &reinterpret_cast<struct sockaddr_in6*>(ai->ai_addr)->sin6_addr;
            } else {
                continue;
            }
            if (inet_ntop(ai->ai_family, src, buf, sizeof(buf))) {
                addrs.push_back(buf);
            }
        }
        freeaddrinfo(res);

        if (addrs.empty()) {
            error = "no addresses";
            return false;
        }
        return true;
    };
}

// ============================================================================
// Policy
// ============================================================================

UrlPolicy UrlPolicy::defaults() {
    UrlPolicy p;
    p.internal_hostnames.push_back("localhost");
    p.internal_hostnames.push_back(".localhost");
    p.internal_hostnames.push_back(".local");
    p.internal_hostnames.push_back(".internal");
    p.internal_hostnames.push_back(".lan");
    p.internal_hostnames.push_back(".home.arpa");
    p.internal_hostnames.push_back("metadata.google.internal");
    return p;
}

UrlPolicy UrlPolicy::from_config(const Config& config) {
    UrlPolicy p = defaults();
    std::vector<std::string> extra =
        config.get_string_list("safety.internal_hostnames", std::vector<std::string>());
    for (size_t i = 0; i < extra.size(); ++i) {
        std::string name = to_lower(trim(extra[i]));
        if (!name.empty()) p.internal_hostnames.push_back(name);
    }
    return p;
}

// ============================================================================
// Address classification
// ============================================================================

static bool is_internal_v4(const unsigned char* b) {
    unsigned a0 = b[0], a1 = b[1];
    if (a0 == 0) return true;                          // 0.0.0.0/8
    if (a0 == 10) return true;                         // 10/8
    if (a0 == 100 && (a1 & 0xC0) == 64) return true;   // 100.64/10 CGNAT
    if (a0 == 127) return true;                        // loopback
    if (a0 == 169 && a1 == 254) return true;           // link-local
    if (a0 == 172 && (a1 & 0xF0) == 16) return true;   // 172.16/12
    if (a0 == 192 && a1 == 168) return true;           // 192.168/16
    if (a0 >= 224) return true;                        // multicast, reserved, broadcast
    return false;
}

bool is_internal_address(const std::string& ip) {
    unsigned char buf[16];

    if (inet_pton(AF_INET, ip.c_str(), buf) == 1) {
        return is_internal_v4(buf);
    }

    if (inet_pton(AF_INET6, ip.c_str(), buf) != 1) {
        return true;
    }

    static const unsigned char zeros[16] = {0};
    if (memcmp(buf, zeros, 16) == 0) return true;                        // ::
    if (memcmp(buf, zeros, 15) == 0 && buf[15] == 1) return true;        // ::1
    if ((buf[0] & 0xFE) == 0xFC) return true;                            // fc00::/7
    if (buf[0] == 0xFE && (buf[1] & 0xC0) == 0x80) return true;          // fe80::/10
    if (buf[0] == 0xFF) return true;                                     // multicast

    // ::ffff:a.b.c.d and the deprecated ::a.b.c.d
    bool mapped = memcmp(buf, zeros, 10) == 0 && buf[10] == 0xFF && buf[11] == 0xFF;
    bool compat = memcmp(buf, zeros, 12) == 0;
    if (mapped || compat) return is_internal_v4(buf + 12);

    // NAT64 64:ff9b::/96
    static const unsigned char nat64[12] = {0x00, 0x64, 0xFF, 0x9B, 0, 0, 0, 0, 0, 0, 0, 0};
    if (memcmp(buf, nat64, 12) == 0) return is_internal_v4(buf + 12);

    return false;
}

bool is_internal_hostname(const std::string& host, const UrlPolicy& policy) {
    std::string h = to_lower(host);
    while (!h.empty() && h[h.size() - 1] == '.') h.erase(h.size() - 1);

    for (size_t i = 0; i < policy.internal_hostnames.size(); ++i) {
        const std::string& entry = policy.internal_hostnames[i];
        if (entry.empty()) continue;
        if (entry[0] == '.') {
            if (ends_with(h, entry) || h == entry.substr(1)) return true;
        } else if (h == entry) {
            return true;
        }
    }
    return false;
}

static bool is_ip_literal(const std::string& host) {
    unsigned char buf[16];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// ============================================================================
// validate_url
// ============================================================================

// Extract scheme and host with curl's parser. Returns false with reason set.
static bool parse_url(const std::string& url, std::string& scheme, std::string& host,
                      std::string& reason) {
    CURLU* h = curl_url();
    if (!h) {
        reason = "URL parser unavailable";
        return false;
    }

    bool ok = false;
    CURLUcode rc = curl_url_set(h, CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        reason = "Invalid URL format";
    } else {
        char* part = nullptr;
        if (curl_url_get(h, CURLUPART_SCHEME, &part, 0) == CURLUE_OK && part) {
            scheme = to_lower(part);
            curl_free(part);
            part = nullptr;
        }
        if (curl_url_get(h, CURLUPART_HOST, &part, 0) == CURLUE_OK && part) {
            host = part;
            curl_free(part);
            ok = true;
        } else {
            reason = "URL has no host";
        }
    }

    curl_url_cleanup(h);

    if (ok && host.size() >= 2 && host[0] == '[' && host[host.size() - 1] == ']') {
        host = host.substr(1, host.size() - 2);
        // Drop a zone id ("fe80::1%25eth0")
        size_t pct = host.find('%');
        if (pct != std::string::npos) host.erase(pct);
    }
    return ok;
}

UrlCheck validate_url(const std::string& url, const HostResolver& resolver) {
    static const UrlPolicy policy = UrlPolicy::defaults();
    return validate_url(url, resolver, policy);
}

UrlCheck validate_url(const std::string& url, const HostResolver& resolver,
                      const UrlPolicy& policy) {
    UrlCheck check;

    std::string scheme, host;
    if (!parse_url(trim(url), scheme, host, check.reason)) {
        return check;
    }
    check.host = host;

    if (scheme != "http" && scheme != "https") {
        LOG_WARN("SSRF blocked: scheme %s in %s", scheme.c_str(), url.c_str());
        check.reason = "Only http and https URLs are allowed, not " + scheme;
        return check;
    }

    if (is_internal_hostname(host, policy)) {
        LOG_WARN("SSRF blocked: internal hostname %s", host.c_str());
        check.reason = "Host " + host + " is an internal name";
        return check;
    }

    std::vector<std::string> addrs;
    if (is_ip_literal(host)) {
        addrs.push_back(host);
    } else {
        std::string error;
        HostResolver resolve = resolver ? resolver : system_resolver();
        if (!resolve(host, addrs, error) || addrs.empty()) {
            check.reason = "Cannot resolve host \"" + host + "\": " +
                           (error.empty() ? std::string("lookup failed") : error);
            return check;
        }
    }

    // Every address must be public; one internal answer is enough to refuse.
    for (size_t i = 0; i < addrs.size(); ++i) {
        if (is_internal_address(addrs[i])) {
            LOG_WARN("SSRF blocked: %s resolves to internal address %s",
                     host.c_str(), addrs[i].c_str());
            check.reason = "URL points to an internal address (" + addrs[i] + ")";
            return check;
        }
    }

    check.safe = true;
    check.resolved_ip = addrs[0];
    return check;
}

} // namespace toolgate
