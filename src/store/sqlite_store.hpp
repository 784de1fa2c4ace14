#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace wacast {

class SqliteStore : public Store {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    void append_message(TenantId tenant, const std::string& recipient,
                        const std::string& content, const std::string& status,
                        uint64_t timestamp) override;

    void set_contact_status(TenantId tenant, const std::string& recipient,
                            const std::string& status) override;

    void upsert_tenant(const TenantRecord& tenant) override;
    std::optional<TenantRecord> tenant(TenantId id) override;

    void upsert_contact(TenantId tenant, const Contact& contact) override;
    std::optional<std::string> contact_status(TenantId tenant,
                                              const std::string& phone) override;

    std::vector<Contact> contacts_for_campaign(
        TenantId tenant, RecipientSelection selection,
        const std::vector<std::string>& selected) override;

    std::vector<MessageRecord> recent_messages(TenantId tenant, uint32_t limit) override;

    DashboardStats dashboard_stats(TenantId tenant, uint64_t day_start) override;

private:
    void init_schema();
    void exec(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace wacast
