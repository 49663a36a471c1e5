#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace streamdl::testing {

// Single-threaded HTTP/1.1 server on 127.0.0.1 that answers each request with a
// canned raw response and then closes the connection.
class LocalHttpServer {
public:
    LocalHttpServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        const int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("cannot listen on loopback");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LocalHttpServer() {
        stop_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    void respond(const std::string& path, std::string raw_response) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[path] = std::move(raw_response);
    }

    void ok(const std::string& path, const std::string& body) {
        respond(path, "HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\nContent-Length: " +
                          std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body);
    }

    void redirect(const std::string& path, const std::string& location) {
        const std::string body = "<a href=\"" + location + "\">moved</a>";
        respond(path, "HTTP/1.1 302 Found\r\nLocation: " + location + "\r\nContent-Length: " +
                          std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body);
    }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    [[nodiscard]] int hits(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_[path];
    }

private:
    void serve() {
        while (!stop_) {
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                if (!stop_ && errno == EINTR) {
                    continue;
                }
                return;
            }
            handle(client);
            ::close(client);
        }
    }

    void handle(int fd) {
        std::string request;
        char buffer[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            request.append(buffer, static_cast<std::size_t>(n));
        }

        const auto first = request.find(' ');
        const auto second = request.find(' ', first + 1);
        const std::string path = request.substr(first + 1, second - first - 1);

        std::string response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++hits_[path];
            const auto it = routes_.find(path);
            if (it != routes_.end()) {
                response = it->second;
            }
        }

        std::size_t sent = 0;
        while (sent < response.size()) {
            const ssize_t n = ::send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    int listen_fd_{-1};
    unsigned short port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::map<std::string, std::string> routes_;
    std::map<std::string, int> hits_;
};

} // namespace streamdl::testing
