#include "control_api.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>

namespace wacast {

namespace {

constexpr uint32_t DEFAULT_RECENT_LIMIT = 10;
constexpr uint32_t MAX_RECENT_LIMIT = 100;
constexpr uint64_t SECONDS_PER_DAY = 86400;

ApiResponse json_response(int status, const nlohmann::json& body) {
    return {status, "application/json", body.dump()};
}

ApiResponse error_response(int status, const std::string& error) {
    return json_response(status, {{"success", false}, {"error", error}});
}

ApiResponse campaign_response(const CampaignResult& result) {
    if (result.success) {
        return json_response(200, {{"success", true}, {"message", result.message}});
    }
    return error_response(400, result.error);
}

// Loads body["media"][].path. Leaves `media` empty when the key is absent.
bool load_request_media(const nlohmann::json& body, const MediaConfig& limits,
                        std::vector<MediaPayload>& media, std::string& error) {
    if (!body.contains("media")) return true;
    if (!body["media"].is_array()) {
        error = "media must be an array";
        return false;
    }
    for (const auto& item : body["media"]) {
        if (!item.is_object() || !item.contains("path") || !item["path"].is_string()) {
            error = "Each media item needs a path";
            return false;
        }
        MediaPayload payload;
        if (!load_media_file(item["path"].get<std::string>(), limits, payload, error)) {
            return false;
        }
        media.push_back(std::move(payload));
    }
    return true;
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

} // namespace

bool parse_tenant_id(const std::string& value, TenantId& out) {
    std::string v = trim(value);
    if (v.empty() || v.size() > 19 ||
        v.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    TenantId id = std::stoull(v);
    if (id == 0) return false;
    out = id;
    return true;
}

ControlApi::ControlApi(CampaignEngine& engine, Store& store, GatewayDirectory& gateways,
                       const Config& config)
    : engine_(engine), store_(store), gateways_(gateways), config_(config)
{}

ApiResponse ControlApi::handle(const ApiRequest& request) {
    TenantId tenant = 0;
    if (!parse_tenant_id(request.header("X-Tenant-Id"), tenant)) {
        return error_response(401, "Unauthorized");
    }

    const std::string& path = request.path;
    bool is_get = request.method == "GET";
    bool is_post = request.method == "POST";

    if (path == "/api/campaign/start") {
        if (!is_post) return error_response(405, "Method not allowed");
        try {
            return start_campaign(tenant, request);
        } catch (const nlohmann::json::exception& e) {
            return error_response(400, std::string("Invalid request body: ") + e.what());
        }
    }
    if (path == "/api/campaign/progress" || path == "/api/campaign_progress") {
        if (!is_get) return error_response(405, "Method not allowed");
        return campaign_progress(tenant);
    }
    if (path == "/api/campaign/stop" || path == "/api/stop-campaign") {
        if (!is_post) return error_response(405, "Method not allowed");
        return stop_campaign(tenant);
    }
    if (path == "/api/connection-status") {
        if (!is_get) return error_response(405, "Method not allowed");
        return connection_status(tenant);
    }
    if (path == "/api/messages/recent") {
        if (!is_get) return error_response(405, "Method not allowed");
        return recent_messages(tenant, request);
    }
    if (path == "/api/messages/send" || path == "/api/send-message") {
        if (!is_post) return error_response(405, "Method not allowed");
        try {
            return send_message(tenant, request);
        } catch (const nlohmann::json::exception& e) {
            return error_response(400, std::string("Invalid request body: ") + e.what());
        }
    }
    if (path == "/api/dashboard/stats" || path == "/api/dashboard_stats") {
        if (!is_get) return error_response(405, "Method not allowed");
        return dashboard_stats(tenant);
    }
    return error_response(404, "Not found");
}

ApiResponse ControlApi::start_campaign(TenantId tenant, const ApiRequest& request) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::exception&) {
        return error_response(400, "Invalid JSON body");
    }
    if (!body.is_object()) return error_response(400, "Invalid JSON body");

    std::string message;
    if (body.contains("message")) {
        if (!body["message"].is_string()) return error_response(400, "message must be a string");
        message = trim(body["message"].get<std::string>());
    }

    uint32_t delay = config_.campaign.default_delay;
    if (body.contains("delay") && !body["delay"].is_null()) {
        if (!body["delay"].is_number_unsigned()) {
            return error_response(400, "delay must be a non-negative integer");
        }
        uint64_t requested = body["delay"].get<uint64_t>();
        if (requested > config_.campaign.max_delay) {
            return error_response(400, "delay must be at most " +
                                  std::to_string(config_.campaign.max_delay) + " seconds");
        }
        delay = static_cast<uint32_t>(requested);
    }

    // Media is loaded up front so every task shares one encoded copy.
    std::vector<MediaPayload> media;
    std::string media_error;
    if (!load_request_media(body, config_.media, media, media_error)) {
        std::cerr << "[api] Tenant " << tenant << ": " << media_error << "\n";
        return error_response(400, media_error);
    }

    if (message.empty() && media.empty()) {
        return error_response(400, "Either message or media files are required");
    }
    if (!message.empty()) {
        auto errors = validate_template(message, config_.campaign.max_template_length);
        if (!errors.empty()) return error_response(400, join_errors(errors));
    }

    std::vector<Contact> contacts;
    if (body.contains("recipients")) {
        if (!body["recipients"].is_array()) {
            return error_response(400, "recipients must be an array");
        }
        for (const auto& r : body["recipients"]) {
            if (!r.is_object()) return error_response(400, "Invalid recipient entry");
            Contact c;
            c.phone = trim(r.value("phone", std::string{}));
            c.name = trim(r.value("name", std::string{}));
            contacts.push_back(std::move(c));
        }
    } else {
        RecipientSelection selection;
        if (!parse_recipient_selection(body.value("recipient_type", std::string{}), selection)) {
            return error_response(400, "Invalid recipient_type");
        }
        std::vector<std::string> selected;
        if (body.contains("selected") && body["selected"].is_array()) {
            for (const auto& p : body["selected"]) {
                if (p.is_string()) selected.push_back(p.get<std::string>());
            }
        }
        if (selection == RecipientSelection::Selected && selected.empty()) {
            return error_response(400, "No contacts selected");
        }
        contacts = store_.contacts_for_campaign(tenant, selection, selected);
    }

    if (contacts.empty()) return error_response(400, "No contacts found");

    auto result = engine_.start(tenant, contacts, message, delay, std::move(media));
    if (!result.success) {
        std::cerr << "[api] Tenant " << tenant << ": campaign rejected: " << result.error << "\n";
    }
    return campaign_response(result);
}

ApiResponse ControlApi::campaign_progress(TenantId tenant) {
    ProgressView view = engine_.progress(tenant);
    const CampaignStatus& s = view.status;
    nlohmann::json j = {
        {"status", campaign_state_to_string(s.state)},
        {"total", s.total},
        {"processed", s.processed},
        {"sent", s.sent},
        {"failed", s.failed},
        {"delay", s.delay_seconds},
        {"media_count", s.media_count},
        {"percentage", view.percentage},
        {"eta", view.eta_seconds},
    };
    if (s.started_epoch != 0) j["started_at"] = s.started_epoch;
    return json_response(200, j);
}

ApiResponse ControlApi::stop_campaign(TenantId tenant) {
    return campaign_response(engine_.stop(tenant));
}

ApiResponse ControlApi::connection_status(TenantId tenant) {
    auto gateway = gateways_.gateway_for(tenant);
    if (!gateway) {
        return json_response(200, {{"success", false},
                                   {"status", "disconnected"},
                                   {"connected", false},
                                   {"error", "WhatsApp instance not configured"}});
    }
    ConnectionState state = gateway->connection_state();
    nlohmann::json j = {{"success", state.success},
                        {"status", state.status},
                        {"connected", state.connected}};
    if (!state.error.empty()) j["error"] = state.error;
    return json_response(200, j);
}

ApiResponse ControlApi::recent_messages(TenantId tenant, const ApiRequest& request) {
    uint32_t limit = DEFAULT_RECENT_LIMIT;
    std::string raw = request.query_param("limit");
    if (!raw.empty()) {
        if (raw.find_first_not_of("0123456789") != std::string::npos || raw.size() > 6) {
            return error_response(400, "limit must be a positive integer");
        }
        limit = static_cast<uint32_t>(std::stoul(raw));
        if (limit == 0) return error_response(400, "limit must be a positive integer");
        if (limit > MAX_RECENT_LIMIT) limit = MAX_RECENT_LIMIT;
    }

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& m : store_.recent_messages(tenant, limit)) {
        rows.push_back({{"phone", m.recipient},
                        {"message", m.content},
                        {"status", m.status},
                        {"timestamp", m.timestamp}});
    }
    return json_response(200, {{"success", true}, {"messages", rows}});
}

ApiResponse ControlApi::send_message(TenantId tenant, const ApiRequest& request) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::exception&) {
        return error_response(400, "Invalid JSON body");
    }
    if (!body.is_object()) return error_response(400, "Invalid JSON body");

    std::string phone;
    if (body.contains("phone") && body["phone"].is_string()) {
        phone = trim(body["phone"].get<std::string>());
    }
    if (phone.empty()) return error_response(400, "Phone number is required");

    std::string message;
    if (body.contains("message")) {
        if (!body["message"].is_string()) return error_response(400, "message must be a string");
        message = trim(body["message"].get<std::string>());
    }

    std::vector<MediaPayload> media;
    std::string media_error;
    if (!load_request_media(body, config_.media, media, media_error)) {
        std::cerr << "[api] Tenant " << tenant << ": " << media_error << "\n";
        return error_response(400, media_error);
    }
    if (message.empty() && media.empty()) {
        return error_response(400, "Either message or media files are required");
    }

    auto gateway = gateways_.gateway_for(tenant);
    if (!gateway) return error_response(400, "WhatsApp instance not configured");

    SendResult result = deliver(*gateway, phone, message, media,
                                std::chrono::milliseconds(config_.gateway.media_gap_ms));
    if (!result.success) {
        std::cerr << "[api] Tenant " << tenant << ": send to " << phone
                  << " failed: " << result.error << "\n";
        return error_response(502, "Failed to send message: " + result.error);
    }

    std::string logged = message;
    if (!media.empty()) {
        logged = "[Media: " + std::to_string(media.size()) + " files] " + message;
    }
    // Already sent, so a log failure is reported but not returned.
    try {
        store_.append_message(tenant, phone, logged, contact_status::Sent, epoch_seconds());
    } catch (const std::runtime_error& e) {
        std::cerr << "[api] Tenant " << tenant << ": failed to log message: " << e.what() << "\n";
    }
    return json_response(200, {{"success", true}, {"message", result.message}});
}

ApiResponse ControlApi::dashboard_stats(TenantId tenant) {
    uint64_t now = epoch_seconds();
    DashboardStats stats = store_.dashboard_stats(tenant, now - now % SECONDS_PER_DAY);
    return json_response(200, {{"success", true},
                               {"total_contacts", stats.total_contacts},
                               {"today_sent", stats.messages_today},
                               {"total_sent", stats.total_messages}});
}

} // namespace wacast
