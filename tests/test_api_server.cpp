#include <catch2/catch.hpp>
#include "api_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <stdexcept>

using namespace wacast;

namespace {

// Send a raw request to 127.0.0.1:port and return the full response text.
std::string roundtrip(uint16_t port, const std::string& raw) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return "";
    }
    ::send(fd, raw.data(), raw.size(), 0);

    std::string out;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

} // namespace

// ── parse_listen_addr ────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[api_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:8090", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8090);
}

TEST_CASE("parse_listen_addr: port 0 means any free port", "[api_server]") {
    std::string host;
    uint16_t port = 1;
    REQUIRE(parse_listen_addr("0.0.0.0:0", host, port));
    REQUIRE(port == 0);
}

TEST_CASE("parse_listen_addr: malformed input", "[api_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8090", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:70000", host, port));
}

// ── url_decode ───────────────────────────────────────────────

TEST_CASE("url_decode: escapes and plus", "[api_server]") {
    REQUIRE(url_decode("a%20b+c") == "a b c");
    REQUIRE(url_decode("%2Bplus") == "+plus");
    REQUIRE(url_decode("bad%zz") == "bad%zz");
    REQUIRE(url_decode("trail%2") == "trail%2");
}

// ── parse_request_head ───────────────────────────────────────

TEST_CASE("parse_request_head: request line, query and headers", "[api_server]") {
    ApiRequest req;
    std::string err;
    REQUIRE(parse_request_head(
        "POST /api/campaign/start?dry=1&name=a%2Fb HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "X-Tenant-Id:  12 \r\n"
        "Content-Type: application/json", req, err));
    REQUIRE(req.method == "POST");
    REQUIRE(req.path == "/api/campaign/start");
    REQUIRE(req.query_param("dry") == "1");
    REQUIRE(req.query_param("name") == "a/b");
    REQUIRE(req.headers.at("x-tenant-id") == "12");
    REQUIRE(req.header("Content-Type") == "application/json");
}

TEST_CASE("parse_request_head: malformed request line", "[api_server]") {
    ApiRequest req;
    std::string err;
    REQUIRE_FALSE(parse_request_head("GARBAGE", req, err));
    REQUIRE(err == "Malformed request line");
    REQUIRE_FALSE(parse_request_head("GET /x FTP/1.0", req, err));
}

TEST_CASE("parse_request_head: header lines without colon are skipped", "[api_server]") {
    ApiRequest req;
    std::string err;
    REQUIRE(parse_request_head("GET / HTTP/1.1\r\nnonsense\r\nA: b", req, err));
    REQUIRE(req.headers.size() == 1);
    REQUIRE(req.header("a") == "b");
}

TEST_CASE("ApiRequest: header lookup is case-insensitive", "[api_server]") {
    ApiRequest req;
    req.headers["x-tenant-id"] = "7";
    req.query_params["limit"] = "5";
    REQUIRE(req.header("X-Tenant-Id") == "7");
    REQUIRE(req.header("missing").empty());
    REQUIRE(req.query_param("limit") == "5");
    REQUIRE(req.query_param("other").empty());
}

// ── Live server ──────────────────────────────────────────────

TEST_CASE("ApiServer: invalid listen address fails to start", "[api_server]") {
    ApiServer server("nowhere", 1024, [](const ApiRequest&) { return ApiResponse{}; });
    std::string err;
    REQUIRE_FALSE(server.start(err));
    REQUIRE(err.find("Invalid listen address") != std::string::npos);
}

TEST_CASE("ApiServer: serves requests on loopback", "[api_server]") {
    ApiRequest seen;
    ApiServer server("127.0.0.1:0", 64, [&seen](const ApiRequest& req) {
        seen = req;
        if (req.path == "/boom") throw std::runtime_error("handler failed");
        return ApiResponse{200, "application/json", R"({"ok":true})"};
    });
    std::string err;
    REQUIRE(server.start(err));
    REQUIRE(server.bound_port() != 0);

    SECTION("GET with query string and headers") {
        auto resp = roundtrip(server.bound_port(),
            "GET /api/messages/recent?limit=5&q=a%20b HTTP/1.1\r\n"
            "Host: localhost\r\nX-Tenant-Id: 3\r\n\r\n");
        REQUIRE(resp.rfind("HTTP/1.1 200 OK", 0) == 0);
        REQUIRE(resp.find(R"({"ok":true})") != std::string::npos);
        REQUIRE(seen.method == "GET");
        REQUIRE(seen.path == "/api/messages/recent");
        REQUIRE(seen.query_param("limit") == "5");
        REQUIRE(seen.query_param("q") == "a b");
        REQUIRE(seen.header("x-tenant-id") == "3");
    }

    SECTION("POST body is read by Content-Length") {
        auto resp = roundtrip(server.bound_port(),
            "POST /api/campaign/stop HTTP/1.1\r\nContent-Length: 7\r\n\r\n{\"a\":1}");
        REQUIRE(resp.rfind("HTTP/1.1 200", 0) == 0);
        REQUIRE(seen.body == "{\"a\":1}");
    }

    SECTION("oversized body is rejected") {
        auto resp = roundtrip(server.bound_port(),
            "POST /x HTTP/1.1\r\nContent-Length: 65\r\n\r\n");
        REQUIRE(resp.rfind("HTTP/1.1 413", 0) == 0);
    }

    SECTION("handler exception becomes 500") {
        auto resp = roundtrip(server.bound_port(), "GET /boom HTTP/1.1\r\n\r\n");
        REQUIRE(resp.rfind("HTTP/1.1 500", 0) == 0);
        REQUIRE(resp.find("Internal server error") != std::string::npos);
    }

    server.stop();
}
