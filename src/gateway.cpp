#include "gateway.hpp"
#include <nlohmann/json.hpp>
#include <thread>

namespace wacast {

EvolutionGateway::EvolutionGateway(EvolutionInstance instance, HttpClient& http)
    : instance_(std::move(instance)), http_(http)
{}

std::string EvolutionGateway::endpoint(const std::string& action) const {
    std::string base = instance_.api_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + action + "/" + instance_.instance_name;
}

std::vector<Header> EvolutionGateway::headers() const {
    return {{"Content-Type", "application/json"},
            {"apikey", instance_.api_key}};
}

static std::string http_failure(const char* what, const HttpResponse& resp) {
    if (resp.status_code == 0) {
        return std::string("Error sending ") + what + ": " +
               (resp.body.empty() ? "network error" : resp.body);
    }
    return std::string("Failed to send ") + what + ": HTTP " +
           std::to_string(resp.status_code) + " - " + resp.body;
}

SendResult EvolutionGateway::send_text(const std::string& recipient, const std::string& text) {
    if (instance_.instance_name.empty()) {
        return {false, "", "Tenant instance not configured"};
    }
    if (recipient.empty() || text.empty()) {
        return {false, "", "Phone number and message are required"};
    }

    nlohmann::json body = {
        {"number", recipient},
        {"textMessage", {{"text", text}}}
    };

    auto resp = http_.post(endpoint("message/sendText"), body.dump(), headers(),
                           instance_.text_timeout);
    if (resp.status_code == 201) {
        return {true, "Message sent successfully", ""};
    }
    return {false, "", http_failure("message", resp)};
}

SendResult EvolutionGateway::send_media(const std::string& recipient,
                                        const std::string& base64_payload,
                                        const std::string& caption,
                                        MediaKind kind) {
    if (instance_.instance_name.empty()) {
        return {false, "", "Tenant instance not configured"};
    }
    if (recipient.empty()) {
        return {false, "", "Phone number is required"};
    }
    if (base64_payload.empty()) {
        return {false, "", "Media data is required"};
    }
    if (kind == MediaKind::Unknown) {
        return {false, "", "Unsupported media type. Use image or video."};
    }

    // The gateway wants the bare base64 string, not a data: URL.
    std::string media = base64_payload;
    if (media.rfind("data:", 0) == 0) {
        auto comma = media.find(',');
        if (comma != std::string::npos) media = media.substr(comma + 1);
    }

    nlohmann::json body = {
        {"number", recipient},
        {"mediaMessage", {
            {"mediatype", media_kind_to_string(kind)},
            {"media", media},
            {"caption", caption}
        }}
    };

    auto resp = http_.post(endpoint("message/sendMedia"), body.dump(), headers(),
                           instance_.media_timeout);
    if (resp.status_code == 201) {
        return {true, std::string("Media ") + media_kind_to_string(kind) + " sent successfully", ""};
    }
    return {false, "", http_failure("media", resp)};
}

ConnectionState EvolutionGateway::connection_state() {
    ConnectionState state;
    if (instance_.instance_name.empty()) {
        state.error = "Tenant instance not configured";
        return state;
    }

    auto resp = http_.get(endpoint("instance/connectionState"), headers(),
                          instance_.status_timeout);
    if (resp.status_code != 200) {
        state.error = resp.status_code == 0
            ? "network error"
            : "HTTP " + std::to_string(resp.status_code) + ": " + resp.body;
        return state;
    }

    try {
        auto j = nlohmann::json::parse(resp.body);
        state.success = true;
        if (j.contains("instance") && j["instance"].is_object() &&
            j["instance"].contains("state") && j["instance"]["state"].is_string()) {
            state.status = j["instance"]["state"].get<std::string>();
        }
        state.connected = state.status == "open";
    } catch (const nlohmann::json::exception& e) {
        state.success = false;
        state.error = std::string("Malformed gateway response: ") + e.what();
    }
    return state;
}

SendResult deliver(Gateway& gateway,
                   const std::string& recipient,
                   const std::string& text,
                   const std::vector<MediaPayload>& media,
                   std::chrono::milliseconds media_gap) {
    if (media.empty()) {
        if (text.empty()) {
            return {false, "", "Either message or media files are required"};
        }
        return gateway.send_text(recipient, text);
    }

    size_t delivered = 0;
    std::string errors;
    for (size_t i = 0; i < media.size(); i++) {
        if (i > 0 && media_gap.count() > 0) {
            std::this_thread::sleep_for(media_gap);
        }
        const std::string& caption = i == 0 ? text : std::string();
        auto r = gateway.send_media(recipient, media[i].base64, caption, media[i].kind);
        if (r.success) {
            delivered++;
        } else {
            if (!errors.empty()) errors += "; ";
            errors += media[i].filename + ": " + r.error;
        }
    }

    if (delivered == media.size()) {
        return {true, "All " + std::to_string(delivered) + " media files sent successfully", ""};
    }
    if (delivered > 0) {
        return {true, std::to_string(delivered) + " of " + std::to_string(media.size()) +
                      " media files sent successfully", errors};
    }
    return {false, "", "Failed to send all " + std::to_string(media.size()) +
                       " media files (" + errors + ")"};
}

} // namespace wacast
