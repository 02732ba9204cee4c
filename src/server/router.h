#ifndef ROUTER_H
#define ROUTER_H

#include "http_request.h"
#include "metrics.h"
#include "rate_limiter.h"
#include "../core/animation_loop.h"
#include "../core/frame_sink.h"
#include <string>

// One client connection as seen by the router: either a complete response,
// or (through the FrameSink side) a streamed body
class HttpResponder : public FrameSink {
public:
    virtual bool sendResponse(int status, const std::string& contentType, const std::string& body) = 0;
};

// Everything the routes need; all references outlive the router
struct RouterContext {
    const ShoutConfig* config = nullptr;
    const FontCache* fonts = nullptr;
    StreamAdmission* admission = nullptr;
    const CancellationSignal* cancellation = nullptr;
    Metrics* metrics = nullptr;
    RateLimiter* rateLimiter = nullptr;   // optional
};

// Public routes:
//   GET /              usage text
//   GET /fonts         loaded fonts and color schemes (JSON)
//   GET /party/<text>  animated stream
//   GET /<text>        static render
void handlePublicRequest(const HttpRequest& req, const std::string& client,
                         const RouterContext& ctx, HttpResponder& out);

// Admin routes: GET /health, GET /metrics
void handleAdminRequest(const HttpRequest& req, const RouterContext& ctx, HttpResponder& out);

#endif // ROUTER_H
