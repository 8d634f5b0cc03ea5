/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <stdexcept>
#include <string_view>
#include <vector>

#include "pathprobe/classifier.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

using Predicate = bool (*)(const RuleContext&);

struct AdviceRule {
    IssueKind kind;
    Predicate when;
    std::vector<std::string_view> causes;
    std::vector<std::string_view> solutions;
};

bool always(const RuleContext&) {
    return true;
}

bool tool_missing(const RuleContext& c) {
    return c.error == ProbeError::ToolUnavailable;
}

bool timed_out(const RuleContext& c) {
    return c.error == ProbeError::Timeout;
}

bool mentions(const RuleContext& c, std::string_view needle) {
    return to_lower(c.message).find(needle) != std::string::npos;
}

bool tls_error(const RuleContext& c) {
    return mentions(c, "tls") || mentions(c, "ssl") || mentions(c, "certificate");
}

bool refused(const RuleContext& c) {
    return mentions(c, "refused") || mentions(c, "failed to connect");
}

bool rate_limited(const RuleContext& c) {
    return c.http_code == 429;
}

bool forbidden(const RuleContext& c) {
    return c.http_code == 401 || c.http_code == 403;
}

bool not_found(const RuleContext& c) {
    return c.http_code == 404;
}

bool gateway_error(const RuleContext& c) {
    return c.http_code == 502 || c.http_code == 503 || c.http_code == 504;
}

// Rows are scanned top to bottom; the first one whose kind and predicate
// match wins.
const std::vector<AdviceRule>& rules() {
    static const std::vector<AdviceRule> table = {
        {IssueKind::DnsFailure, tool_missing,
         {"dig is not installed"},
         {"Install dig (dnsutils or bind-utils) and run the diagnostic again"}},
        {IssueKind::DnsFailure, timed_out,
         {"The DNS server does not respond", "DNS traffic is blocked by a firewall"},
         {"Switch your resolver to 1.1.1.1 or 8.8.8.8", "Check your internet connection"}},
        {IssueKind::DnsFailure, always,
         {"The domain does not exist or is not registered", "The DNS server does not respond",
          "DNS is blocked by a firewall"},
         {"Check the domain name", "Switch your resolver to 1.1.1.1 or 8.8.8.8",
          "Check your internet connection"}},

        {IssueKind::DnsSlow, always,
         {"The DNS server is geographically distant", "The DNS server is overloaded",
          "No local DNS cache"},
         {"Use a faster resolver such as Cloudflare (1.1.1.1) or Google (8.8.8.8)",
          "Enable a local caching resolver"}},
        {IssueKind::DnsAcceptable, always,
         {"The resolver answers without a warm cache"},
         {"Use a faster resolver such as Cloudflare (1.1.1.1) or Google (8.8.8.8)"}},

        {IssueKind::TcpFailure, tool_missing,
         {"curl is not installed"},
         {"Install curl and run the diagnostic again"}},
        {IssueKind::TcpFailure, timed_out,
         {"The server does not answer", "A firewall silently drops the connection",
          "Routing problem between you and the server"},
         {"Open the site in a browser to confirm it is up", "Try again over a VPN",
          "Contact your ISP if the problem persists"}},
        {IssueKind::TcpFailure, tls_error,
         {"The server certificate is invalid or expired", "TLS is intercepted by a proxy"},
         {"Check the certificate with: openssl s_client -connect <host>:443",
          "Make sure no proxy or antivirus intercepts TLS"}},
        {IssueKind::TcpFailure, refused,
         {"Nothing listens on the target port", "Port 443 is blocked",
          "A firewall rejects the connection"},
         {"Check that the service is running on the expected port",
          "Try from another network to rule out local filtering"}},
        {IssueKind::TcpFailure, always,
         {"The website is down", "Port 443 is blocked", "A firewall blocks the connection",
          "Routing problem"},
         {"Open the site in a browser to confirm it is up", "Try again over a VPN",
          "Contact your ISP if the problem persists"}},

        {IssueKind::ConnectSlow, always,
         {"The server is on another continent", "Poor routing from your ISP", "Network congestion"},
         {"This is usually caused by distance and is hard to improve",
          "Try a VPN endpoint closer to the server"}},
        {IssueKind::ConnectAcceptable, always,
         {"The server is not geographically close"},
         {"Try a VPN endpoint closer to the server"}},

        {IssueKind::SslSlow, always,
         {"Long certificate chain", "OCSP stapling is disabled", "High latency to the server"},
         {"This is usually a server-side issue", "Check that nothing intercepts the TLS session"}},
        {IssueKind::SslAcceptable, always,
         {"The TLS handshake needs several round trips"},
         {"Enable TLS 1.3 and session resumption on the server"}},

        {IssueKind::TtfbSlow, always,
         {"The server spends a long time generating the response", "Backend or database overload"},
         {"Check server-side processing time", "Put a cache or CDN in front of the origin"}},
        {IssueKind::TtfbAcceptable, always,
         {"The response is generated dynamically"},
         {"Put a cache or CDN in front of the origin"}},

        {IssueKind::TotalSlow, always,
         {"The server responds slowly", "Unstable network connection", "Many redirects"},
         {"Check your network speed", "Try again at a different time of day"}},
        {IssueKind::TotalAcceptable, always,
         {"Large response or several redirects"},
         {"Check your network speed"}},

        {IssueKind::HttpClientError, rate_limited,
         {"Too many requests from your address"},
         {"Wait before retrying", "Reduce the number of stability samples"}},
        {IssueKind::HttpClientError, forbidden,
         {"Authentication is required", "Access is blocked for your address or region"},
         {"Check whether the site requires a login", "Try from another network"}},
        {IssueKind::HttpClientError, not_found,
         {"The page does not exist"},
         {"Check that the URL is correct"}},
        {IssueKind::HttpClientError, always,
         {"Invalid request", "Login required", "The page does not exist"},
         {"Check that the URL is correct"}},

        {IssueKind::HttpServerError, gateway_error,
         {"The origin behind the proxy or CDN is down", "The server is under maintenance"},
         {"Wait and try again later", "Check the service status page"}},
        {IssueKind::HttpServerError, always,
         {"The server is under maintenance", "The server is overloaded",
          "Server-side application error"},
         {"Wait and try again later", "Check the service status page"}},

        {IssueKind::BottleneckHop, always,
         {"Congestion at this hop", "A long-distance link starts here"},
         {"Try a VPN to take a different route", "Report persistent congestion to your ISP"}},
        {IssueKind::ManyUnresponsiveHops, always,
         {"Routers filter ICMP (usually harmless)", "A firewall blocks traceroute", "Routing problem"},
         {"This can be normal if the website still works", "Use tcptraceroute for more detail"}},
        {IssueKind::ManyHops, always,
         {"The server is far away", "Suboptimal routing"},
         {"A VPN may provide a shorter route"}},
        {IssueKind::RoutingFailure, tool_missing,
         {"traceroute is not installed"},
         {"Install traceroute and run the diagnostic again"}},
        {IssueKind::RoutingFailure, always,
         {"traceroute is blocked on this network"},
         {"Run the diagnostic from another network"}},

        {IssueKind::StabilityDown, always,
         {"The server rejects or drops every request", "The network connection is down"},
         {"Check your internet connection", "Contact your ISP if the problem persists"}},
        {IssueKind::StabilityPoor, always,
         {"Unstable network", "Weak Wi-Fi signal", "ISP problem", "Overloaded server"},
         {"Move closer to the Wi-Fi router or use a LAN cable", "Restart the modem or router",
          "Contact your ISP if the problem persists"}},
        {IssueKind::StabilityDegraded, always,
         {"Temporary network congestion", "Unstable Wi-Fi signal"},
         {"Check Wi-Fi signal strength", "Try again in a few minutes"}},
        {IssueKind::HighJitter, always,
         {"Unstable network", "Other devices are using the bandwidth"},
         {"Reduce the number of devices using the network at the same time",
          "Use a LAN cable instead of Wi-Fi"}},
        {IssueKind::StabilityFailure, tool_missing,
         {"curl is not installed"},
         {"Install curl and run the diagnostic again"}},
        {IssueKind::StabilityFailure, always,
         {"The server answers too slowly to complete the samples"},
         {"Retry later or lower the sample count"}},
    };
    return table;
}

std::vector<std::string> to_strings(const std::vector<std::string_view>& in) {
    return {in.begin(), in.end()};
}

}  // namespace

Advice lookup_advice(IssueKind kind, const RuleContext& ctx) {
    for (const auto& rule : rules()) {
        if (rule.kind == kind && rule.when(ctx)) {
            return {to_strings(rule.causes), to_strings(rule.solutions)};
        }
    }
    throw std::logic_error("advice table has no catch-all row for an issue kind");
}

}  // namespace pathprobe
