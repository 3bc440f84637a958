/**
 * @file http_test_server.hpp
 * @brief Scripted loopback HTTP server for client and backend tests.
 * @author Dimitris Kafetzis
 *
 * Accepts connections on 127.0.0.1 one at a time, records each request and
 * answers with the next canned response. Connections beyond the script get
 * a 500.
 */

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace edge_twin::testing {

struct RecordedRequest {
    std::string method;
    std::string target;
    std::string head;
    std::string body;
};

class HttpTestServer {
public:
    explicit HttpTestServer(std::deque<std::string> responses)
        : responses_(std::move(responses)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");

        int opt = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 8) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    }

    ~HttpTestServer() {
        thread_.request_stop();
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
    }

    HttpTestServer(const HttpTestServer&) = delete;
    HttpTestServer& operator=(const HttpTestServer&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    static std::string reply(int status, std::string_view reason, std::string_view body = {}) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + std::string{reason} + "\r\n";
        out += "Content-Type: application/json\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
        out += body;
        return out;
    }

private:
    void serve(std::stop_token stop) {
        while (!stop.stop_requested()) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;

            auto request = read_request(fd);
            std::string response;
            {
                std::lock_guard lock(mutex_);
                requests_.push_back(std::move(request));
                if (responses_.empty()) {
                    response = reply(500, "Internal Server Error");
                } else {
                    response = std::move(responses_.front());
                    responses_.pop_front();
                }
            }

            size_t sent = 0;
            while (sent < response.size()) {
                auto n = ::send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            ::close(fd);
        }
    }

    static RecordedRequest read_request(int fd) {
        std::string raw;
        char buf[4096];
        size_t header_end = std::string::npos;

        while (header_end == std::string::npos) {
            auto n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            raw.append(buf, static_cast<size_t>(n));
            header_end = raw.find("\r\n\r\n");
        }

        RecordedRequest req;
        if (header_end == std::string::npos) return req;
        req.head = raw.substr(0, header_end);

        size_t content_length = 0;
        if (auto cl = req.head.find("Content-Length: "); cl != std::string::npos) {
            content_length = std::stoul(req.head.substr(cl + 16));
        }
        while (raw.size() < header_end + 4 + content_length) {
            auto n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            raw.append(buf, static_cast<size_t>(n));
        }
        req.body = raw.substr(header_end + 4, content_length);

        auto sp1 = req.head.find(' ');
        auto sp2 = req.head.find(' ', sp1 + 1);
        req.method = req.head.substr(0, sp1);
        req.target = req.head.substr(sp1 + 1, sp2 - sp1 - 1);
        return req;
    }

    int listen_fd_{-1};
    uint16_t port_{0};
    std::deque<std::string> responses_;
    std::vector<RecordedRequest> requests_;
    mutable std::mutex mutex_;
    std::jthread thread_;
};

}  // namespace edge_twin::testing
