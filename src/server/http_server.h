#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include "router.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Thin HTTP/1.1 listener over POSIX sockets: one public and one admin port,
// one joined thread per connection, Connection: close on every response.
// Socket reads and writes never block past their deadline or a stop request.
class HttpServer {
public:
    explicit HttpServer(const RouterContext& ctx);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind both listeners and start accepting. Returns false and sets errorMsg on failure.
    bool start(std::string& errorMsg);

    // Stop accepting, cancel streams through the shared CancellationSignal and wait
    // up to the shutdown grace for them to close. Returns false if streams or
    // connections were still open after the grace period (they are abandoned).
    bool stop(CancellationSignal& cancellation);

    // Port actually bound (useful when configured as 0)
    int publicPort() const { return public_port_; }
    int adminPort() const { return admin_port_; }

private:
    void acceptLoop(int listenFd, bool admin);
    void handleConnection(int fd, const std::string& client, bool admin, uint64_t id);

    // Join connection threads that have finished, or all of them
    void joinConnections(bool finishedOnly);

    RouterContext ctx_;
    int public_fd_ = -1;
    int admin_fd_ = -1;
    int public_port_ = 0;
    int admin_port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread public_thread_;
    std::thread admin_thread_;

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    int open_connections_ = 0;
    uint64_t next_connection_id_ = 0;
    std::map<uint64_t, std::thread> connection_threads_;
    std::vector<uint64_t> finished_connections_;
};

// Create a listening TCP socket on host:port. Returns the fd, or -1 with errorMsg set.
int openListener(const std::string& host, int port, int& boundPort, std::string& errorMsg);

#endif // HTTP_SERVER_H
