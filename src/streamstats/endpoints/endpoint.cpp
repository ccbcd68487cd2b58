#include "streamstats/endpoints/endpoint.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

namespace streamstats {
namespace endpoints {

namespace {

core::Result<Url> UrlError(const std::string& text, const std::string& reason) {
    return core::Result<Url>::error("Failed to parse URL " + text + ": " + reason,
                                    core::Error::Code::INVALID_ARGUMENT);
}

bool ValidScheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

bool ParseInt64(const std::string& text, int64_t* out) {
    if (text.empty()) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])) && !(i == 0 && text[i] == '-')) {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return false;
    }
    *out = static_cast<int64_t>(value);
    return true;
}

} // namespace

std::string Url::Authority() const {
    std::string out;
    if (host.find(':') != std::string::npos) {
        out = "[" + host + "]";
    } else {
        out = host;
    }
    if (port) {
        out += ":" + std::to_string(*port);
    }
    return out;
}

std::string Url::ToString() const {
    std::string out = scheme + "://";
    if (!userinfo.empty()) {
        out += userinfo + "@";
    }
    out += Authority();
    out += path;
    if (!query.empty()) {
        out += "?" + query;
    }
    if (!fragment.empty()) {
        out += "#" + fragment;
    }
    return out;
}

core::Result<Url> ParseUrl(const std::string& text) {
    for (char c : text) {
        if (std::iscntrl(static_cast<unsigned char>(c)) || c == ' ') {
            return UrlError(text, "invalid character in URL");
        }
    }

    Url url;
    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return UrlError(text, "missing scheme");
    }
    url.scheme = text.substr(0, scheme_end);
    if (!ValidScheme(url.scheme)) {
        return UrlError(text, "invalid scheme '" + url.scheme + "'");
    }
    for (auto& c : url.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    size_t pos = scheme_end + 3;
    size_t authority_end = text.find_first_of("/?#", pos);
    if (authority_end == std::string::npos) {
        authority_end = text.size();
    }
    std::string authority = text.substr(pos, authority_end - pos);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return UrlError(text, "missing ']' in host");
        }
        url.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return UrlError(text, "unexpected characters after IPv6 host");
            }
            port_text = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            if (authority.find(':') != colon) {
                return UrlError(text, "too many colons in address");
            }
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (!port_text.empty()) {
        int64_t port = 0;
        if (!ParseInt64(port_text, &port) || port < 0 || port > 65535) {
            return UrlError(text, "invalid port '" + port_text + "'");
        }
        url.port = static_cast<uint16_t>(port);
    }

    size_t path_end = text.find_first_of("?#", authority_end);
    if (path_end == std::string::npos) {
        path_end = text.size();
    }
    url.path = text.substr(authority_end, path_end - authority_end);

    if (path_end < text.size() && text[path_end] == '?') {
        size_t query_end = text.find('#', path_end);
        if (query_end == std::string::npos) {
            query_end = text.size();
        }
        url.query = text.substr(path_end + 1, query_end - path_end - 1);
        path_end = query_end;
    }
    if (path_end < text.size() && text[path_end] == '#') {
        url.fragment = text.substr(path_end + 1);
    }
    return core::Result<Url>(std::move(url));
}

std::string Endpoint::ConnectTarget() const {
    return url.scheme + "://" + url.Authority() + app_path;
}

bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.ToString() == b.ToString() && a.pixels == b.pixels;
}

core::Result<Endpoint> ParseEndpoint(const std::string& text) {
    auto parsed = ParseUrl(text);
    if (!parsed.ok()) {
        return core::Result<Endpoint>::error(parsed.error(), parsed.code());
    }

    Endpoint endpoint;
    endpoint.url = parsed.take_value();
    if (endpoint.url.host.empty()) {
        return core::Result<Endpoint>::error("URL " + text + " has an empty host",
                                             core::Error::Code::INVALID_ARGUMENT);
    }

    // Pull "pixels=<int>" out of the query, keep everything else in order
    if (!endpoint.url.query.empty()) {
        std::vector<std::string> kept;
        size_t start = 0;
        const std::string& query = endpoint.url.query;
        while (start <= query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) end = query.size();
            std::string param = query.substr(start, end - start);
            size_t eq = param.find('=');
            std::string key = eq == std::string::npos ? param : param.substr(0, eq);
            if (key == "pixels") {
                std::string value = eq == std::string::npos ? "" : param.substr(eq + 1);
                int64_t pixels = 0;
                if (!ParseInt64(value, &pixels) || pixels < 0) {
                    return core::Result<Endpoint>::error(
                        "URL " + text + " has an invalid pixels value '" + value + "'",
                        core::Error::Code::INVALID_ARGUMENT);
                }
                endpoint.pixels = pixels;
            } else if (!param.empty()) {
                kept.push_back(param);
            }
            start = end + 1;
        }
        std::string rebuilt;
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) rebuilt += "&";
            rebuilt += kept[i];
        }
        endpoint.url.query = rebuilt;
    }

    const std::string& path = endpoint.url.path;
    size_t slash = path.rfind('/');
    std::string prefix = slash == std::string::npos ? "" : path.substr(0, slash + 1);
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (prefix.find_first_not_of('/') == std::string::npos || name.empty()) {
        return core::Result<Endpoint>::error(
            "URL path needs at least two components (have '" + prefix + "' and '" + name + "'): " + text,
            core::Error::Code::INVALID_ARGUMENT);
    }
    endpoint.app_path = prefix;
    endpoint.stream_name = name;
    return core::Result<Endpoint>(std::move(endpoint));
}

} // namespace endpoints
} // namespace streamstats
