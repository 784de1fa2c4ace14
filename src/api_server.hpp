#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace wacast {

// A parsed inbound request from the web layer.
struct ApiRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/api/campaign/progress"
    std::map<std::string, std::string> query_params;  // URL-decoded
    std::map<std::string, std::string> headers;       // names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name is lowercased first), or "" if absent.
    std::string header(const std::string& name) const;
};

struct ApiResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Single-threaded HTTP/1.1 server for the control API. Sits behind the web
// application or a reverse proxy; handles one connection at a time on a
// background accept thread.
class ApiServer {
public:
    using Handler = std::function<ApiResponse(const ApiRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8090"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    ApiServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it.
    void stop();

    // Port actually bound (useful with port 0)
    uint16_t bound_port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;
    void close_fds();

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Parse "host:port" into host and port. Port 0 asks the kernel for any free
// port. Returns false if the string is malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and headers (everything before the blank line).
// Header names are lowercased; query parameters are URL-decoded.
bool parse_request_head(const std::string& head, ApiRequest& out, std::string& error);

// Decode %XX escapes and '+' as space.
std::string url_decode(const std::string& s);

} // namespace wacast
