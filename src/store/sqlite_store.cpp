#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace wacast {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteStore: prepare failed: ") +
                                 sqlite3_errmsg(db));
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteStore: write failed: ") +
                                 sqlite3_errmsg(db));
    }
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteStore: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteStore: schema setup failed: " + msg);
    }
}

void SqliteStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS tenants ("
         "  id            INTEGER PRIMARY KEY,"
         "  name          TEXT NOT NULL DEFAULT '',"
         "  instance_name TEXT UNIQUE,"
         "  api_key       TEXT NOT NULL DEFAULT ''"
         ");");

    exec("CREATE TABLE IF NOT EXISTS contacts ("
         "  id      INTEGER PRIMARY KEY AUTOINCREMENT,"
         "  user_id INTEGER NOT NULL,"
         "  phone   TEXT NOT NULL,"
         "  name    TEXT,"
         "  status  TEXT DEFAULT 'pending',"
         "  sent_at INTEGER,"
         "  UNIQUE(user_id, phone)"
         ");");

    exec("CREATE TABLE IF NOT EXISTS messages ("
         "  id        INTEGER PRIMARY KEY AUTOINCREMENT,"
         "  user_id   INTEGER NOT NULL,"
         "  phone     TEXT NOT NULL,"
         "  message   TEXT NOT NULL,"
         "  status    TEXT DEFAULT 'sent',"
         "  timestamp INTEGER NOT NULL"
         ");");

    exec("CREATE INDEX IF NOT EXISTS idx_messages_user_ts "
         "ON messages(user_id, timestamp);");
}

void SqliteStore::append_message(TenantId tenant, const std::string& recipient,
                                 const std::string& content, const std::string& status,
                                 uint64_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "INSERT INTO messages (user_id, phone, message, status, timestamp) "
                 "VALUES (?, ?, ?, ?, ?);", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant));
    sqlite3_bind_text(g.stmt, 2, recipient.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 5, static_cast<sqlite3_int64>(timestamp));
    step_done(db_, g);
}

void SqliteStore::set_contact_status(TenantId tenant, const std::string& recipient,
                                     const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "UPDATE contacts SET status = ?,"
                 "  sent_at = CASE WHEN ? = 'sent' THEN strftime('%s','now') ELSE sent_at END "
                 "WHERE phone = ? AND user_id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, recipient.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(tenant));
    step_done(db_, g);
}

void SqliteStore::upsert_tenant(const TenantRecord& tenant) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "INSERT INTO tenants (id, name, instance_name, api_key) VALUES (?, ?, ?, ?) "
                 "ON CONFLICT(id) DO UPDATE SET name = excluded.name,"
                 "  instance_name = excluded.instance_name, api_key = excluded.api_key;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant.id));
    sqlite3_bind_text(g.stmt, 2, tenant.name.c_str(), -1, SQLITE_TRANSIENT);
    if (tenant.instance_name.empty()) {
        sqlite3_bind_null(g.stmt, 3);
    } else {
        sqlite3_bind_text(g.stmt, 3, tenant.instance_name.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_text(g.stmt, 4, tenant.api_key.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, g);
}

std::optional<TenantRecord> SqliteStore::tenant(TenantId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT id, name, instance_name, api_key FROM tenants WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    TenantRecord rec;
    rec.id = static_cast<TenantId>(sqlite3_column_int64(g.stmt, 0));
    rec.name = column_text(g.stmt, 1);
    rec.instance_name = column_text(g.stmt, 2);
    rec.api_key = column_text(g.stmt, 3);
    return rec;
}

void SqliteStore::upsert_contact(TenantId tenant, const Contact& contact) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "INSERT INTO contacts (user_id, phone, name) VALUES (?, ?, ?) "
                 "ON CONFLICT(user_id, phone) DO UPDATE SET name = excluded.name;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant));
    sqlite3_bind_text(g.stmt, 2, contact.phone.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, contact.name.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, g);
}

std::optional<std::string> SqliteStore::contact_status(TenantId tenant,
                                                       const std::string& phone) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT status FROM contacts WHERE user_id = ? AND phone = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant));
    sqlite3_bind_text(g.stmt, 2, phone.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return column_text(g.stmt, 0);
}

std::vector<Contact> SqliteStore::contacts_for_campaign(
        TenantId tenant, RecipientSelection selection,
        const std::vector<std::string>& selected) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql;
    switch (selection) {
        case RecipientSelection::Selected: {
            if (selected.empty()) return {};
            std::string placeholders;
            for (size_t i = 0; i < selected.size(); i++) {
                placeholders += i == 0 ? "?" : ",?";
            }
            sql = "SELECT phone, name FROM contacts WHERE user_id = ? AND phone IN (" +
                  placeholders + ") ORDER BY id;";
            break;
        }
        case RecipientSelection::Pending:
            sql = "SELECT phone, name FROM contacts WHERE user_id = ? AND phone NOT IN ("
                  "  SELECT DISTINCT phone FROM messages WHERE user_id = ?"
                  ") ORDER BY id;";
            break;
        case RecipientSelection::All:
            sql = "SELECT phone, name FROM contacts WHERE user_id = ? ORDER BY id;";
            break;
    }

    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    int col = 1;
    sqlite3_bind_int64(g.stmt, col++, static_cast<sqlite3_int64>(tenant));
    if (selection == RecipientSelection::Pending) {
        sqlite3_bind_int64(g.stmt, col++, static_cast<sqlite3_int64>(tenant));
    } else if (selection == RecipientSelection::Selected) {
        for (const auto& phone : selected) {
            sqlite3_bind_text(g.stmt, col++, phone.c_str(), -1, SQLITE_TRANSIENT);
        }
    }

    std::vector<Contact> contacts;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        contacts.push_back(Contact{column_text(g.stmt, 0), column_text(g.stmt, 1)});
    }
    return contacts;
}

std::vector<MessageRecord> SqliteStore::recent_messages(TenantId tenant, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT phone, message, status, timestamp FROM messages "
                 "WHERE user_id = ? ORDER BY timestamp DESC, id DESC LIMIT ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant));
    sqlite3_bind_int(g.stmt, 2, static_cast<int>(limit));

    std::vector<MessageRecord> rows;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        MessageRecord rec;
        rec.recipient = column_text(g.stmt, 0);
        rec.content = column_text(g.stmt, 1);
        if (rec.content.size() > 50) rec.content = rec.content.substr(0, 50) + "...";
        rec.status = column_text(g.stmt, 2);
        if (rec.status.empty()) rec.status = contact_status::Sent;
        rec.timestamp = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        rows.push_back(std::move(rec));
    }
    return rows;
}

DashboardStats SqliteStore::dashboard_stats(TenantId tenant, uint64_t day_start) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT "
                 "(SELECT COUNT(*) FROM contacts WHERE user_id = ?1), "
                 "(SELECT COUNT(*) FROM messages WHERE user_id = ?1 AND timestamp >= ?2), "
                 "(SELECT COUNT(*) FROM messages WHERE user_id = ?1);", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(tenant));
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(day_start));

    DashboardStats stats;
    if (sqlite3_step(g.stmt) != SQLITE_ROW)
        throw std::runtime_error(std::string("SqliteStore: stats query failed: ") + sqlite3_errmsg(db_));
    stats.total_contacts = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
    stats.messages_today = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 1));
    stats.total_messages = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
    return stats;
}

} // namespace wacast
