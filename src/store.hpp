#pragma once
#include "gateway.hpp"
#include "message_template.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wacast {

namespace contact_status {
    constexpr const char* Pending = "pending";
    constexpr const char* Sent    = "sent";
    constexpr const char* Failed  = "failed";
} // namespace contact_status

// One row of the append-only message log
struct MessageRecord {
    std::string recipient;
    std::string content;
    std::string status;
    uint64_t timestamp = 0; // epoch seconds
};

// Per-tenant counters for the dashboard
struct DashboardStats {
    uint64_t total_contacts = 0;
    uint64_t messages_today = 0; // sent at or after day_start
    uint64_t total_messages = 0;
};

struct TenantRecord {
    TenantId id = 0;
    std::string name;
    std::string instance_name;
    std::string api_key; // empty = use the gateway's global key
};

// Which contacts a campaign targets
enum class RecipientSelection { All, Pending, Selected };

// Returns false for unknown names.
bool parse_recipient_selection(const std::string& name, RecipientSelection& out);

// Side-effect sink written by the dispatcher after every task. Implementations
// may throw std::runtime_error; callers log and continue.
class DeliveryRecorder {
public:
    virtual ~DeliveryRecorder() = default;

    virtual void append_message(TenantId tenant, const std::string& recipient,
                                const std::string& content, const std::string& status,
                                uint64_t timestamp) = 0;

    virtual void set_contact_status(TenantId tenant, const std::string& recipient,
                                    const std::string& status) = 0;
};

// Persistent storage for tenants, contacts and the message log
class Store : public DeliveryRecorder {
public:
    virtual std::string backend_name() const = 0;

    virtual void upsert_tenant(const TenantRecord& tenant) = 0;
    virtual std::optional<TenantRecord> tenant(TenantId id) = 0;

    virtual void upsert_contact(TenantId tenant, const Contact& contact) = 0;
    virtual std::optional<std::string> contact_status(TenantId tenant,
                                                      const std::string& phone) = 0;

    virtual std::vector<Contact> contacts_for_campaign(
        TenantId tenant, RecipientSelection selection,
        const std::vector<std::string>& selected) = 0;

    // Newest first; content shortened to 50 chars + "..."
    virtual std::vector<MessageRecord> recent_messages(TenantId tenant, uint32_t limit) = 0;

    virtual DashboardStats dashboard_stats(TenantId tenant, uint64_t day_start) = 0;
};

} // namespace wacast
