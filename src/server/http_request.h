#ifndef HTTP_REQUEST_H
#define HTTP_REQUEST_H

#include "../core/config.h"
#include "../core/render_options.h"
#include <map>
#include <string>

struct HttpRequest {
    std::string method;
    std::string target;   // raw request target, e.g. "/party/hi?c=fire"
    std::string path;     // target without the query, still percent-encoded
    std::string version;
    std::map<std::string, std::string> query;     // decoded
    std::map<std::string, std::string> headers;   // keys lower-cased
};

// Parse the request line and headers (everything before the blank line).
// Returns false and sets errorMsg on malformed input.
bool parseHttpRequest(const std::string& head, HttpRequest& req, std::string& errorMsg);

// Decode %XX escapes; '+' becomes a space when plusAsSpace is set.
// Malformed escapes are kept literally.
std::string percentDecode(const std::string& s, bool plusAsSpace);

std::map<std::string, std::string> parseQueryString(const std::string& query);

// Build RenderOptions from the query (f|font, c|color, mw|maxwidth, t|timeout,
// s|speed, a|align, b|border) over the configured defaults
bool renderOptionsFromQuery(const std::map<std::string, std::string>& query, const ShoutConfig& cfg,
                            RenderOptions& opts, std::string& errorMsg);

const char* httpStatusText(int status);

// Complete response with Content-Length and Connection: close
std::string buildHttpResponse(int status, const std::string& contentType, const std::string& body);

// Header block for a streamed body that ends when the connection closes
std::string buildStreamHeaders(const std::string& contentType);

#endif // HTTP_REQUEST_H
