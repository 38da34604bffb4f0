#include "endpoint.hpp"
#include <boost/asio/ip/address.hpp>
#include <algorithm>
#include <cctype>

namespace endpoint {

namespace {

constexpr std::size_t kMaxHostLength = 253;
constexpr std::size_t kMaxLabelLength = 63;

std::string strip(const std::string& s, const char* chars) {
    auto first = s.find_first_not_of(chars);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(chars);
    return s.substr(first, last - first + 1);
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

bool has_space(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// Length of a leading "scheme://" (RFC 3986 scheme syntax), or 0
std::size_t scheme_length(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
    std::size_t i = 1;
    while (i < s.size()) {
        unsigned char c = s[i];
        if (!std::isalnum(c) && c != '+' && c != '.' && c != '-') break;
        ++i;
    }
    if (s.compare(i, 3, "://") != 0) return 0;
    return i + 3;
}

bool valid_label(const std::string& label) {
    if (label.empty() || label.size() > kMaxLabelLength) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    return std::all_of(label.begin(), label.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
}

std::optional<std::string> canonical_hostname(std::string host) {
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (host.size() > kMaxHostLength) return std::nullopt;

    bool charset_ok = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-';
    });
    if (!charset_ok) return std::nullopt;

    // Digits and dots only: a malformed IPv4 literal, not a name
    bool numeric = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.';
    });
    if (numeric) return std::nullopt;

    std::size_t labels = 0;
    std::size_t start = 0;
    while (true) {
        auto dot = host.find('.', start);
        std::string label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!valid_label(label)) return std::nullopt;
        ++labels;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (labels < 2) return std::nullopt;

    return host;
}

} // namespace

std::string ServerEndpoint::authority() const {
    if (!port) return host;
    return host + ":" + std::to_string(*port);
}

std::string ServerEndpoint::connect_host() const {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

std::string ServerEndpoint::connect_port() const {
    return port ? std::to_string(*port) : "80";
}

std::optional<ServerEndpoint> parse_endpoint(const std::string& raw) {
    std::string s = strip(strip(raw, " \t\r\n"), " \t\r\n<>\"'");
    if (s.empty()) return std::nullopt;

    s = s.substr(scheme_length(s));

    // Only trailing slashes may follow the authority
    auto delimiter = s.find_first_of("/\\?#");
    std::string authority = s.substr(0, delimiter);
    if (delimiter != std::string::npos &&
        s.find_first_not_of('/', delimiter) != std::string::npos) {
        return std::nullopt;
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty() || has_space(authority)) return std::nullopt;

    std::string host;
    std::string port_text;
    bool bracketed = false;

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return std::nullopt;
            port_text = tail.substr(1);
            if (!all_digits(port_text)) return std::nullopt;
        }
        bracketed = true;
    } else if (std::count(authority.begin(), authority.end(), ':') >= 2) {
        host = authority;
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
        if (!all_digits(port_text)) return std::nullopt;
    } else {
        host = authority;
    }

    if (!bracketed && !host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty()) return std::nullopt;

    ServerEndpoint result;
    if (!port_text.empty()) {
        if (port_text.size() > 5) return std::nullopt;
        int port = std::stoi(port_text);
        if (port < 1 || port > 65535) return std::nullopt;
        result.port = static_cast<uint16_t>(port);
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (!ec) {
        result.host = address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
        return result;
    }
    if (bracketed) return std::nullopt;

    auto name = canonical_hostname(host);
    if (!name) return std::nullopt;
    result.host = *name;
    return result;
}

HostCheck normalize_host(const std::string& raw) {
    auto parsed = parse_endpoint(raw);
    if (!parsed) return {};
    return {true, parsed->authority()};
}

bool is_valid_host(const std::string& raw) {
    return normalize_host(raw).ok;
}

} // namespace endpoint
