#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace endpoint {

struct ServerEndpoint {
    std::string host;                 // lowercase name or canonical address; IPv6 is bracketed
    std::optional<uint16_t> port;

    bool empty() const { return host.empty(); }

    // host[:port], as persisted and substituted into request URLs
    std::string authority() const;

    // Name handed to the resolver (brackets removed)
    std::string connect_host() const;
    std::string connect_port() const;
};

struct HostCheck {
    bool ok = false;
    std::string host;  // normalized authority, empty when !ok
};

// Accepts "host", "host:port", "http(s)://host[:port][/]", IPv4/IPv6 literals.
// User info ("user@host") is stripped. Paths, whitespace inside the host,
// single-label names and malformed addresses are rejected.
HostCheck normalize_host(const std::string& raw);

bool is_valid_host(const std::string& raw);

std::optional<ServerEndpoint> parse_endpoint(const std::string& raw);

} // namespace endpoint
