#include <catch2/catch.hpp>
#include "control_api.hpp"
#include "store/sqlite_store.hpp"
#include "fake_collaborators.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace wacast;
using namespace std::chrono_literals;

namespace {

std::string api_test_path() {
    return "/tmp/wacast_test_api_" + std::to_string(getpid()) + ".db";
}

EngineOptions fast_options() {
    EngineOptions opts;
    opts.poll_interval = 10ms;
    opts.media_gap = 0ms;
    return opts;
}

struct ApiFixture {
    std::string path = api_test_path();
    std::string upload_dir = "/tmp/wacast_test_api_uploads_" + std::to_string(getpid());
    SqliteStore store{path};
    FakeDirectory directory;
    Config config;
    CampaignEngine engine{directory, store, fast_options()};
    ControlApi api{engine, store, directory, config};

    ApiFixture() {
        std::filesystem::create_directories(upload_dir);
        config.media.upload_dir = upload_dir;
        config.gateway.media_gap_ms = 0;
    }

    ~ApiFixture() {
        engine.shutdown();
        std::filesystem::remove_all(upload_dir);
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    ApiResponse call(const std::string& method, const std::string& target,
                     const std::string& body = "", const std::string& tenant = "1") {
        ApiRequest req;
        req.method = method;
        auto q = target.find('?');
        req.path = target.substr(0, q);
        if (q != std::string::npos) {
            auto kv = target.substr(q + 1);
            auto eq = kv.find('=');
            req.query_params[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        if (!tenant.empty()) req.headers["x-tenant-id"] = tenant;
        req.body = body;
        return api.handle(req);
    }
};

nlohmann::json parse(const ApiResponse& r) {
    return nlohmann::json::parse(r.body);
}

} // namespace

// ── Routing / auth ───────────────────────────────────────────

TEST_CASE("ControlApi: missing tenant header is unauthorized", "[control_api]") {
    ApiFixture f;
    auto r = f.call("GET", "/api/campaign/progress", "", "");
    REQUIRE(r.status == 401);
    REQUIRE(parse(r)["success"] == false);

    REQUIRE(f.call("GET", "/api/campaign/progress", "", "abc").status == 401);
    REQUIRE(f.call("GET", "/api/campaign/progress", "", "0").status == 401);
}

TEST_CASE("ControlApi: unknown route and wrong method", "[control_api]") {
    ApiFixture f;
    REQUIRE(f.call("GET", "/api/nothing").status == 404);
    REQUIRE(f.call("GET", "/api/campaign/start").status == 405);
    REQUIRE(f.call("POST", "/api/campaign/progress").status == 405);
}

TEST_CASE("parse_tenant_id: accepts positive integers only", "[control_api]") {
    TenantId id = 0;
    REQUIRE(parse_tenant_id(" 42 ", id));
    REQUIRE(id == 42);
    REQUIRE_FALSE(parse_tenant_id("", id));
    REQUIRE_FALSE(parse_tenant_id("-1", id));
    REQUIRE_FALSE(parse_tenant_id("12a", id));
    REQUIRE_FALSE(parse_tenant_id("99999999999999999999", id));
}

// ── Start ────────────────────────────────────────────────────

TEST_CASE("ControlApi: start with explicit recipients", "[control_api]") {
    ApiFixture f;
    auto r = f.call("POST", "/api/campaign/start",
        R"({"recipients":[{"phone":"111","name":"Ann"},{"phone":"222"}],
            "message":"Hi {name}","delay":0})");
    REQUIRE(r.status == 200);
    auto j = parse(r);
    REQUIRE(j["success"] == true);
    REQUIRE(j["message"] == "Campaign started! 2 messages queued for processing.");
    REQUIRE(f.engine.queued_tasks() == 2);
    REQUIRE(f.engine.progress(1).status.delay_seconds == 0);
}

TEST_CASE("ControlApi: start uses default delay", "[control_api]") {
    ApiFixture f;
    f.config.campaign.default_delay = 9;
    f.call("POST", "/api/campaign/start", R"({"recipients":[{"phone":"111"}],"message":"Hi"})");
    REQUIRE(f.engine.progress(1).status.delay_seconds == 9);
}

TEST_CASE("ControlApi: start selects stored contacts", "[control_api]") {
    ApiFixture f;
    f.store.upsert_contact(1, {"111", "Ann"});
    f.store.upsert_contact(1, {"222", "Bob"});
    f.store.append_message(1, "111", "old", contact_status::Sent, 1);

    auto r = f.call("POST", "/api/campaign/start",
                    R"({"recipient_type":"pending","message":"Hi"})");
    REQUIRE(r.status == 200);
    REQUIRE(f.engine.progress(1).status.total == 1);

    r = f.call("POST", "/api/campaign/start",
               R"({"recipient_type":"selected","selected":["111","222"],"message":"Hi"})");
    REQUIRE(r.status == 200);
    REQUIRE(f.engine.progress(1).status.total == 2);
}

TEST_CASE("ControlApi: start rejects bad input", "[control_api]") {
    ApiFixture f;
    auto r = f.call("POST", "/api/campaign/start", "{oops");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Invalid JSON body");

    r = f.call("POST", "/api/campaign/start", R"({"recipients":[{"phone":"1"}]})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Either message or media files are required");

    r = f.call("POST", "/api/campaign/start",
               R"({"recipients":[{"phone":"1"}],"message":"Hi {surname}"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"].get<std::string>().find("Invalid placeholders") !=
            std::string::npos);

    r = f.call("POST", "/api/campaign/start",
               R"({"recipients":[{"phone":"1"}],"message":"Hi","delay":-2})");
    REQUIRE(r.status == 400);

    r = f.call("POST", "/api/campaign/start", R"({"recipient_type":"vip","message":"Hi"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Invalid recipient_type");

    r = f.call("POST", "/api/campaign/start", R"({"message":"Hi"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "No contacts found");

    r = f.call("POST", "/api/campaign/start",
               R"({"recipients":[{"phone":""}],"message":"Hi"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Contact 1 has no phone number");

    REQUIRE(f.engine.queued_tasks() == 0);
}

TEST_CASE("ControlApi: start with media file", "[control_api]") {
    ApiFixture f;
    std::string media_path = f.upload_dir + "/banner.jpg";
    {
        std::ofstream out(media_path, std::ios::binary);
        out << "jpegbytes";
    }

    auto r = f.call("POST", "/api/campaign/start",
        R"({"recipients":[{"phone":"111"}],"media":[{"path":")" + media_path + R"("}]})");

    REQUIRE(r.status == 200);
    REQUIRE(parse(r)["message"] ==
            "Campaign started! 1 messages with 1 media files queued for processing.");
    REQUIRE(f.engine.progress(1).status.media_count == 1);

    r = f.call("POST", "/api/campaign/start",
        R"({"recipients":[{"phone":"111"}],"media":[{"path":"x.exe"}]})");
    REQUIRE(r.status == 400);
}

TEST_CASE("ControlApi: start rejects media outside upload dir", "[control_api]") {
    ApiFixture f;
    std::string outside = "/tmp/wacast_test_api_outside_" + std::to_string(getpid()) + ".jpg";
    {
        std::ofstream out(outside, std::ios::binary);
        out << "jpegbytes";
    }

    auto r = f.call("POST", "/api/campaign/start",
        R"({"recipients":[{"phone":"111"}],"media":[{"path":")" + outside + R"("}]})");
    std::filesystem::remove(outside);

    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"].get<std::string>().find("outside upload directory") !=
            std::string::npos);
    REQUIRE(f.engine.queued_tasks() == 0);
}

TEST_CASE("ControlApi: start rejects delay above the configured maximum", "[control_api]") {
    ApiFixture f;
    f.config.campaign.max_delay = 60;
    auto r = f.call("POST", "/api/campaign/start",
                    R"({"recipients":[{"phone":"111"}],"message":"Hi","delay":61})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "delay must be at most 60 seconds");

    // Would wrap to 0 if narrowed to 32 bits before the check.
    r = f.call("POST", "/api/campaign/start",
               R"({"recipients":[{"phone":"111"}],"message":"Hi","delay":4294967296})");
    REQUIRE(r.status == 400);
    REQUIRE(f.engine.queued_tasks() == 0);

    r = f.call("POST", "/api/campaign/start",
               R"({"recipients":[{"phone":"111"}],"message":"Hi","delay":60})");
    REQUIRE(r.status == 200);
    REQUIRE(f.engine.progress(1).status.delay_seconds == 60);
}

// ── Progress / stop ──────────────────────────────────────────

TEST_CASE("ControlApi: progress before any campaign", "[control_api]") {
    ApiFixture f;
    auto j = parse(f.call("GET", "/api/campaign/progress"));
    REQUIRE(j["status"] == "none");
    REQUIRE(j["total"] == 0);
    REQUIRE(j["percentage"] == 0.0);
}

TEST_CASE("ControlApi: campaign runs to completion via dispatcher", "[control_api]") {
    ApiFixture f;
    f.directory.state->failing.insert("222");
    f.engine.start_dispatcher();
    f.call("POST", "/api/campaign/start",
           R"({"recipients":[{"phone":"111"},{"phone":"222"}],"message":"Hi","delay":0})");

    REQUIRE(wait_until([&]() {
        return parse(f.call("GET", "/api/campaign_progress"))["status"] == "completed";
    }));
    auto j = parse(f.call("GET", "/api/campaign/progress"));
    REQUIRE(j["processed"] == 2);
    REQUIRE(j["sent"] == 1);
    REQUIRE(j["failed"] == 1);
    REQUIRE(j["percentage"] == 100.0);
    REQUIRE(j["eta"] == 0);

    auto recent = parse(f.call("GET", "/api/messages/recent?limit=5"));
    REQUIRE(recent["success"] == true);
    REQUIRE(recent["messages"].size() == 2);
}

TEST_CASE("ControlApi: stop and legacy stop alias", "[control_api]") {
    ApiFixture f;
    auto r = f.call("POST", "/api/campaign/stop");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "No active campaign found");

    f.call("POST", "/api/campaign/start", R"({"recipients":[{"phone":"111"}],"message":"Hi"})");
    r = f.call("POST", "/api/stop-campaign");
    REQUIRE(r.status == 200);
    REQUIRE(parse(r)["message"] == "Campaign stopped");
    REQUIRE(parse(f.call("GET", "/api/campaign/progress"))["status"] == "stopped");
}

TEST_CASE("ControlApi: tenants do not see each other", "[control_api]") {
    ApiFixture f;
    f.call("POST", "/api/campaign/start",
           R"({"recipients":[{"phone":"111"}],"message":"Hi"})", "1");
    REQUIRE(parse(f.call("GET", "/api/campaign/progress", "", "2"))["status"] == "none");
    REQUIRE(f.call("POST", "/api/campaign/stop", "", "2").status == 400);
}

// ── Connection / messages ────────────────────────────────────

TEST_CASE("ControlApi: connection status", "[control_api]") {
    ApiFixture f;
    auto j = parse(f.call("GET", "/api/connection-status"));
    REQUIRE(j["success"] == true);
    REQUIRE(j["connected"] == true);
    REQUIRE(j["status"] == "open");

    f.directory.unknown.insert(3);
    j = parse(f.call("GET", "/api/connection-status", "", "3"));
    REQUIRE(j["success"] == false);
    REQUIRE(j["connected"] == false);
    REQUIRE(j["status"] == "disconnected");
}

TEST_CASE("ControlApi: recent messages limit validation", "[control_api]") {
    ApiFixture f;
    for (int i = 0; i < 15; i++) {
        f.store.append_message(1, std::to_string(i), "m", contact_status::Sent, i);
    }
    REQUIRE(parse(f.call("GET", "/api/messages/recent"))["messages"].size() == 10);
    REQUIRE(parse(f.call("GET", "/api/messages/recent?limit=3"))["messages"].size() == 3);
    REQUIRE(f.call("GET", "/api/messages/recent?limit=0").status == 400);
    REQUIRE(f.call("GET", "/api/messages/recent?limit=x").status == 400);
}

// ── Single send / dashboard ──────────────────────────────────

TEST_CASE("ControlApi: send a single text message", "[control_api]") {
    ApiFixture f;
    auto r = f.call("POST", "/api/messages/send", R"({"phone":" 111 ","message":"Hello"})");
    REQUIRE(r.status == 200);
    auto j = parse(r);
    REQUIRE(j["success"] == true);
    REQUIRE(j["message"] == "Message sent successfully");

    REQUIRE(f.directory.state->attempts() == std::vector<std::string>{"111"});
    auto rows = f.store.recent_messages(1, 10);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].recipient == "111");
    REQUIRE(rows[0].content == "Hello");
    REQUIRE(rows[0].status == contact_status::Sent);
}

TEST_CASE("ControlApi: send with media logs a media summary", "[control_api]") {
    ApiFixture f;
    {
        std::ofstream out(f.upload_dir + "/a.png", std::ios::binary);
        out << "png";
    }
    auto r = f.call("POST", "/api/send-message",
                    R"({"phone":"111","message":"Look","media":[{"path":"a.png"}]})");
    REQUIRE(r.status == 200);
    REQUIRE(parse(r)["message"] == "All 1 media files sent successfully");
    REQUIRE(f.directory.state->media_calls == 1);

    auto rows = f.store.recent_messages(1, 10);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].content == "[Media: 1 files] Look");
}

TEST_CASE("ControlApi: send rejects bad input", "[control_api]") {
    ApiFixture f;
    auto r = f.call("POST", "/api/messages/send", R"({"message":"Hello"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Phone number is required");

    r = f.call("POST", "/api/messages/send", R"({"phone":"111"})");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "Either message or media files are required");

    r = f.call("POST", "/api/messages/send", "[1]");
    REQUIRE(r.status == 400);

    REQUIRE(f.call("GET", "/api/messages/send").status == 405);
    REQUIRE(f.directory.state->attempts().empty());
}

TEST_CASE("ControlApi: send failure is reported and not logged", "[control_api]") {
    ApiFixture f;
    f.directory.state->failing.insert("222");
    auto r = f.call("POST", "/api/messages/send", R"({"phone":"222","message":"Hello"})");
    REQUIRE(r.status == 502);
    auto j = parse(r);
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"].get<std::string>().find("Failed to send message") == 0);
    REQUIRE(f.store.recent_messages(1, 10).empty());

    f.directory.unknown.insert(4);
    r = f.call("POST", "/api/messages/send", R"({"phone":"222","message":"Hello"})", "4");
    REQUIRE(r.status == 400);
    REQUIRE(parse(r)["error"] == "WhatsApp instance not configured");
}

TEST_CASE("ControlApi: dashboard stats", "[control_api]") {
    ApiFixture f;
    auto j = parse(f.call("GET", "/api/dashboard/stats"));
    REQUIRE(j["success"] == true);
    REQUIRE(j["total_contacts"] == 0);
    REQUIRE(j["today_sent"] == 0);
    REQUIRE(j["total_sent"] == 0);

    f.store.upsert_contact(1, {"111", "Ann"});
    f.store.upsert_contact(1, {"222", "Bob"});
    f.store.upsert_contact(2, {"333", "Cy"});
    f.store.append_message(1, "111", "old", contact_status::Sent, 1);
    f.call("POST", "/api/messages/send", R"({"phone":"222","message":"Hello"})");

    j = parse(f.call("GET", "/api/dashboard_stats"));
    REQUIRE(j["total_contacts"] == 2);
    REQUIRE(j["today_sent"] == 1);
    REQUIRE(j["total_sent"] == 2);

    REQUIRE(f.call("POST", "/api/dashboard/stats").status == 405);
}
