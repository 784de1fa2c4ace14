#pragma once
#include "http.hpp"
#include "media.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wacast {

using TenantId = uint64_t;

// Outcome of one gateway call. Ordinary failures (expired auth, bad
// recipient, network timeout) come back here instead of as exceptions.
struct SendResult {
    bool success = false;
    std::string message;
    std::string error;
};

struct ConnectionState {
    bool success = false;
    std::string status = "disconnected";
    bool connected = false;
    std::string error;
};

// Abstract per-tenant WhatsApp sending capability
class Gateway {
public:
    virtual ~Gateway() = default;

    virtual SendResult send_text(const std::string& recipient, const std::string& text) = 0;

    virtual SendResult send_media(const std::string& recipient,
                                  const std::string& base64_payload,
                                  const std::string& caption,
                                  MediaKind kind) = 0;

    virtual ConnectionState connection_state() { return {}; }
};

// Resolves a tenant to its gateway connection. Returns nullptr when the
// tenant has no configured connection.
class GatewayDirectory {
public:
    virtual ~GatewayDirectory() = default;
    virtual std::unique_ptr<Gateway> gateway_for(TenantId tenant) = 0;
};

struct EvolutionInstance {
    std::string api_url;
    std::string instance_name;
    std::string api_key;
    long text_timeout = 30;
    long media_timeout = 60;
    long status_timeout = 5;
};

// Evolution API client bound to one tenant instance
class EvolutionGateway : public Gateway {
public:
    EvolutionGateway(EvolutionInstance instance, HttpClient& http);

    SendResult send_text(const std::string& recipient, const std::string& text) override;

    SendResult send_media(const std::string& recipient,
                          const std::string& base64_payload,
                          const std::string& caption,
                          MediaKind kind) override;

    ConnectionState connection_state() override;

    // Build endpoint URL, e.g. endpoint("message/sendText")
    std::string endpoint(const std::string& action) const;

    const EvolutionInstance& instance() const { return instance_; }

private:
    std::vector<Header> headers() const;

    EvolutionInstance instance_;
    HttpClient& http_;
};

// Deliver one campaign message: text only, or every media item in order with
// the text as caption on the first item. Succeeds if anything was delivered.
SendResult deliver(Gateway& gateway,
                   const std::string& recipient,
                   const std::string& text,
                   const std::vector<MediaPayload>& media,
                   std::chrono::milliseconds media_gap);

} // namespace wacast
