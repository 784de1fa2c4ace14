#include "api_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace wacast {

// ── URL helpers ───────────────────────────────────────────────────────────────

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

std::string ApiRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ApiRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string port_str = addr.substr(pos + 1);
    if (port_str.empty() || port_str.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        int p = std::stoi(port_str);
        if (p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Request head ──────────────────────────────────────────────────────────────

bool parse_request_head(const std::string& head, ApiRequest& out, std::string& error) {
    auto rl_end = head.find("\r\n");
    if (rl_end == std::string::npos) rl_end = head.size();

    std::istringstream ss(head.substr(0, rl_end));
    std::string target, version;
    if (!(ss >> out.method >> target >> version) || version.rfind("HTTP/", 0) != 0) {
        error = "Malformed request line";
        return false;
    }

    auto q = target.find('?');
    out.path = target.substr(0, q);
    if (q != std::string::npos) out.query_params = parse_query_string(target.substr(q + 1));

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto line_end = head.find("\r\n", pos);
        if (line_end == std::string::npos) line_end = head.size();
        std::string line = head.substr(pos, line_end - pos);
        pos = line_end + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        out.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

// ── ApiServer ─────────────────────────────────────────────────────────────────

ApiServer::ApiServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::close_fds() {
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

bool ApiServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fds();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_fds();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (::listen(server_fd_, 16) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void ApiServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[server] Shutdown signal failed: " << std::strerror(errno) << "\n";
    }
    if (thread_.joinable()) thread_.join();
    close_fds();
}

void ApiServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd >= 0) {
            struct timeval tv{10, 0};  // 10s recv timeout
            ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            handle_connection(cfd);
            ::close(cfd);
        }
    }
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        default:  return "OK";
    }
}

static void send_http_response(int fd, const ApiResponse& resp) {
    std::string out =
        "HTTP/1.1 " + std::to_string(resp.status) + " " + reason_phrase(resp.status) + "\r\n"
        "Content-Type: " + resp.content_type + "\r\n"
        "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + resp.body;

    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

static ApiResponse plain(int status, const std::string& body) {
    return {status, "text/plain", body};
}

void ApiServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_http_response(fd, plain(400, "Headers too large"));
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    std::string leftover = buf.substr(hdr_end + 4);

    ApiRequest req;
    std::string parse_error;
    if (!parse_request_head(buf.substr(0, hdr_end), req, parse_error)) {
        send_http_response(fd, plain(400, parse_error));
        return;
    }

    if (req.method == "POST") {
        size_t content_len = 0;
        auto it = req.headers.find("content-length");
        if (it != req.headers.end()) {
            try {
                content_len = std::stoul(it->second);
            } catch (const std::exception&) {
                send_http_response(fd, plain(400, "Invalid Content-Length"));
                return;
            }
        }

        if (content_len > max_body_) {
            send_http_response(fd, plain(413, "Payload too large"));
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) break;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    ApiResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] " << req.method << " " << req.path << " failed: "
                  << e.what() << "\n";
        resp = {500, "application/json",
                R"({"success":false,"error":"Internal server error"})"};
    }
    send_http_response(fd, resp);
}

} // namespace wacast
