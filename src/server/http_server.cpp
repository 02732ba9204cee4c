#include "http_server.h"
#include "../utils/logging.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

const size_t kMaxRequestHead = 8192;
const int kAcceptPollMs = 250;
const int kPollSliceMs = 50;
const std::chrono::seconds kReadTimeout{10};
const std::chrono::seconds kSendStallTimeout{10};
const std::chrono::seconds kRateLimiterIdle{600};

// Write all of data before the deadline. The socket is written without blocking
// and polled in short slices, so a peer that stops reading cannot hold the
// thread past the deadline or past cancellation.
bool sendAll(int fd, const std::string& data, Clock::time_point deadline,
             const CancellationSignal* cancellation) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return false;
        }

        // Send buffer full: wait for room
        while (true) {
            if (cancellation && cancellation->isCancelled()) {
                LOG_DEBUG("Send abandoned: shutting down");
                return false;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0) {
                LOG_DEBUG("Send stalled past its deadline, treating client as gone");
                return false;
            }
            pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), kPollSliceMs)));
            if (ready < 0 && errno != EINTR) {
                return false;
            }
            if (ready > 0) {
                break;
            }
        }
    }
    return true;
}

// Socket-backed responder. Every send is bounded by the stall timeout and, while
// streaming, by the stream's effective deadline.
class SocketResponder : public HttpResponder {
public:
    SocketResponder(int fd, const CancellationSignal* cancellation)
        : fd_(fd), cancellation_(cancellation), write_deadline_(Clock::time_point::max()) {}

    void setWriteDeadline(Clock::time_point deadline) override {
        write_deadline_ = deadline;
    }

    bool begin() override {
        return send(buildStreamHeaders("text/plain; charset=utf-8"));
    }

    bool write(const std::string& data) override {
        return send(data);
    }

    bool flush() override {
        return true;  // TCP_NODELAY is set; nothing is buffered in user space
    }

    bool sendResponse(int status, const std::string& contentType, const std::string& body) override {
        return send(buildHttpResponse(status, contentType, body));
    }

private:
    bool send(const std::string& data) {
        return sendAll(fd_, data, std::min(write_deadline_, Clock::now() + kSendStallTimeout), cancellation_);
    }

    int fd_;
    const CancellationSignal* cancellation_;
    Clock::time_point write_deadline_;
};

// Read until the blank line that ends the request head. Gives up after
// kReadTimeout, or as soon as the server starts stopping.
bool readRequestHead(int fd, std::string& head, const std::atomic<bool>& stopping) {
    const Clock::time_point deadline = Clock::now() + kReadTimeout;
    char buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() > kMaxRequestHead || stopping || Clock::now() >= deadline) {
            return false;
        }
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kPollSliceMs);
        if (ready < 0 && errno != EINTR) {
            return false;
        }
        if (ready <= 0) {
            continue;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        head.append(buf, static_cast<size_t>(n));
    }
    head.resize(head.find("\r\n\r\n"));
    return true;
}

std::string peerAddress(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    }
    return host;
}

} // namespace

int openListener(const std::string& host, int port, int& boundPort, std::string& errorMsg) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        errorMsg = "cannot resolve " + host + ": " + gai_strerror(rc);
        return -1;
    }

    int fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        int one = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
            break;
        }
        errorMsg = std::string("cannot listen on ") + host + ":" + service + ": " + std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        if (errorMsg.empty()) {
            errorMsg = "no usable address for " + host + ":" + service;
        }
        return -1;
    }

    sockaddr_storage bound;
    socklen_t len = sizeof(bound);
    boundPort = port;
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET) {
            boundPort = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            boundPort = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }
    return fd;
}

HttpServer::HttpServer(const RouterContext& ctx) : ctx_(ctx) {}

HttpServer::~HttpServer() {
    stopping_ = true;
    if (public_thread_.joinable()) public_thread_.join();
    if (admin_thread_.joinable()) admin_thread_.join();
    // Every connection ends on its own: reads and sends are bounded, streams by their deadline
    joinConnections(false);
    if (public_fd_ >= 0) ::close(public_fd_);
    if (admin_fd_ >= 0) ::close(admin_fd_);
}

void HttpServer::joinConnections(bool finishedOnly) {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (finishedOnly) {
            for (uint64_t id : finished_connections_) {
                auto it = connection_threads_.find(id);
                if (it != connection_threads_.end()) {
                    threads.push_back(std::move(it->second));
                    connection_threads_.erase(it);
                }
            }
        } else {
            for (auto& entry : connection_threads_) {
                threads.push_back(std::move(entry.second));
            }
            connection_threads_.clear();
        }
        finished_connections_.clear();
    }
    for (auto& t : threads) {
        t.join();
    }
}

bool HttpServer::start(std::string& errorMsg) {
    const ServerConfig& server = ctx_.config->server;

    public_fd_ = openListener(server.host, server.publicPort, public_port_, errorMsg);
    if (public_fd_ < 0) {
        return false;
    }
    admin_fd_ = openListener(server.host, server.adminPort, admin_port_, errorMsg);
    if (admin_fd_ < 0) {
        ::close(public_fd_);
        public_fd_ = -1;
        return false;
    }

    public_thread_ = std::thread(&HttpServer::acceptLoop, this, public_fd_, false);
    admin_thread_ = std::thread(&HttpServer::acceptLoop, this, admin_fd_, true);

    LOG_COUT("[INFO] Listening on " << server.host << ":" << public_port_ << " (admin :" << admin_port_
             << "), max " << ctx_.admission->maxStreams() << " concurrent streams") << std::endl;
    return true;
}

void HttpServer::acceptLoop(int listenFd, bool admin) {
    auto lastPrune = RateLimiter::Clock::now();
    while (!stopping_) {
        pollfd pfd{listenFd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0 && errno != EINTR) {
            LOG_CERR("[ERROR] poll on listener failed: " << std::strerror(errno)) << std::endl;
            break;
        }

        if (!admin && ctx_.rateLimiter) {
            auto now = RateLimiter::Clock::now();
            if (now - lastPrune > kRateLimiterIdle) {
                size_t removed = ctx_.rateLimiter->prune(now, kRateLimiterIdle);
                LOG_DEBUG("Pruned " << removed << " idle rate-limit buckets");
                lastPrune = now;
            }
        }

        joinConnections(true);

        if (ready <= 0) {
            continue;
        }

        sockaddr_storage addr;
        socklen_t len = sizeof(addr);
        int fd = ::accept(listenFd, reinterpret_cast<sockaddr*>(&addr), &len);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                LOG_CERR("[WARNING] accept failed: " << std::strerror(errno)) << std::endl;
            }
            continue;
        }

        // Registered under the lock, so the thread cannot report itself finished before it is tracked
        std::lock_guard<std::mutex> lock(connections_mutex_);
        const uint64_t id = next_connection_id_++;
        open_connections_++;
        connection_threads_.emplace(id, std::thread(&HttpServer::handleConnection, this, fd, peerAddress(addr), admin, id));
    }
}

void HttpServer::handleConnection(int fd, const std::string& client, bool admin, uint64_t id) {
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    SocketResponder responder(fd, ctx_.cancellation);
    std::string head;
    HttpRequest req;
    std::string errorMsg;
    if (!readRequestHead(fd, head, stopping_)) {
        LOG_DEBUG("Dropped connection from " << client << " before a full request arrived");
    } else if (!parseHttpRequest(head, req, errorMsg)) {
        if (!responder.sendResponse(400, "text/plain; charset=utf-8", errorMsg + "\n")) {
            LOG_DEBUG("Client " << client << " gone before 400 response");
        }
    } else {
        LOG_DEBUG(client << " " << req.method << " " << req.target);
        if (admin) {
            handleAdminRequest(req, ctx_, responder);
        } else {
            handlePublicRequest(req, client, ctx_, responder);
        }
    }

    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open_connections_--;
        finished_connections_.push_back(id);
        connections_cv_.notify_all();
    }
}

bool HttpServer::stop(CancellationSignal& cancellation) {
    LOG_COUT("[INFO] Shutting down: no longer accepting connections") << std::endl;
    stopping_ = true;
    if (public_thread_.joinable()) public_thread_.join();
    if (admin_thread_.joinable()) admin_thread_.join();

    cancellation.cancel();

    const std::chrono::milliseconds grace = ctx_.config->server.shutdownGrace;
    if (!ctx_.admission->waitIdle(grace)) {
        LOG_CERR("[WARNING] Abandoning " << ctx_.admission->activeCount() << " streams still open after "
                 << grace.count() << "ms grace period") << std::endl;
        return false;
    }

    // Streams are closed; give short requests the same grace to finish writing
    std::unique_lock<std::mutex> lock(connections_mutex_);
    if (!connections_cv_.wait_for(lock, grace, [this] { return open_connections_ == 0; })) {
        LOG_CERR("[WARNING] Abandoning " << open_connections_ << " open connections") << std::endl;
        return false;
    }
    lock.unlock();
    joinConnections(false);
    LOG_COUT("[INFO] All streams closed") << std::endl;
    return true;
}
