#include "http_request.h"
#include "../utils/string_utils.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// First present key among the aliases
const std::string* findParam(const std::map<std::string, std::string>& query,
                             const char* shortKey, const char* longKey) {
    auto it = query.find(shortKey);
    if (it != query.end()) {
        return &it->second;
    }
    it = query.find(longKey);
    return it != query.end() ? &it->second : nullptr;
}

bool parseIntParam(const std::string& name, const std::string& value, int& out, std::string& errorMsg) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            out = parsed;
            return true;
        }
    } catch (const std::exception&) {
        // reported below
    }
    errorMsg = "invalid " + name + ": " + value;
    return false;
}

} // namespace

bool parseHttpRequest(const std::string& head, HttpRequest& req, std::string& errorMsg) {
    std::vector<std::string> lines = splitLines(head);
    if (lines.empty() || lines[0].empty()) {
        errorMsg = "empty request";
        return false;
    }

    std::istringstream requestLine(lines[0]);
    if (!(requestLine >> req.method >> req.target >> req.version)) {
        errorMsg = "malformed request line";
        return false;
    }
    if (req.target.empty() || req.target[0] != '/') {
        errorMsg = "request target must be an absolute path";
        return false;
    }
    if (req.version.compare(0, 5, "HTTP/") != 0) {
        errorMsg = "unsupported protocol: " + req.version;
        return false;
    }

    size_t q = req.target.find('?');
    req.path = req.target.substr(0, q);
    if (q != std::string::npos) {
        req.query = parseQueryString(req.target.substr(q + 1));
    }

    for (size_t i = 1; i < lines.size(); i++) {
        if (lines[i].empty()) {
            break;
        }
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) {
            errorMsg = "malformed header line";
            return false;
        }
        req.headers[toLowerAscii(trimString(lines[i].substr(0, colon)))] = trimString(lines[i].substr(colon + 1));
    }
    return true;
}

std::string percentDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    for (const auto& pair : splitString(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = percentDecode(pair.substr(0, eq), true);
        std::string value = eq == std::string::npos ? "" : percentDecode(pair.substr(eq + 1), true);
        // First occurrence wins
        params.emplace(toLowerAscii(key), value);
    }
    return params;
}

bool renderOptionsFromQuery(const std::map<std::string, std::string>& query, const ShoutConfig& cfg,
                            RenderOptions& opts, std::string& errorMsg) {
    opts = makeDefaultRenderOptions(cfg);

    if (const std::string* v = findParam(query, "f", "font")) {
        opts.font = toLowerAscii(*v);
    }
    if (const std::string* v = findParam(query, "c", "color")) {
        opts.color = toLowerAscii(*v);
    }
    if (const std::string* v = findParam(query, "a", "align")) {
        opts.align = toLowerAscii(*v);
    }
    if (const std::string* v = findParam(query, "b", "border")) {
        opts.border = toLowerAscii(*v);
    }
    if (const std::string* v = findParam(query, "mw", "maxwidth")) {
        if (!parseIntParam("maxwidth", *v, opts.maxWidth, errorMsg)) return false;
    }
    if (const std::string* v = findParam(query, "t", "timeout")) {
        if (!parseIntParam("timeout", *v, opts.timeout, errorMsg)) return false;
    }
    if (const std::string* v = findParam(query, "s", "speed")) {
        if (!parseIntParam("speed", *v, opts.speed, errorMsg)) return false;
    }
    return validateRenderOptions(opts, errorMsg);
}

const char* httpStatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string buildHttpResponse(int status, const std::string& contentType, const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << httpStatusText(status) << "\r\n"
        << "Content-Type: " << contentType << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "X-Content-Type-Options: nosniff\r\n"
        << "Connection: close\r\n";
    if (status == 503) {
        oss << "Retry-After: 5\r\n";
    }
    oss << "\r\n" << body;
    return oss.str();
}

std::string buildStreamHeaders(const std::string& contentType) {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: " + contentType + "\r\n"
           "Cache-Control: no-cache\r\n"
           "X-Content-Type-Options: nosniff\r\n"
           "Connection: close\r\n"
           "\r\n";
}
