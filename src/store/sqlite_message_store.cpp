#include "store/sqlite_message_store.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include "utils/logging.hpp"

namespace tfbot::store {
namespace {

constexpr const char* kTag = "store";

std::string NowIso() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Finalizes the statement on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            const std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw StoreError("prepare failed: " + message);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void BindText(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

SqliteMessageStore::SqliteMessageStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

SqliteMessageStore::~SqliteMessageStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteMessageStore::RecordExchange(const bus::InboundEvent& event,
                                        const std::string& query,
                                        const std::string& response,
                                        const std::string& destination_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireOpen();
    Statement stmt(db_,
        "INSERT INTO exchanges(event_id, author_id, author_name, channel_id, guild_id, "
        "destination_id, query, response, created_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.BindText(1, event.event_id);
    stmt.BindText(2, event.author_id);
    stmt.BindText(3, event.author_name);
    stmt.BindText(4, event.channel_id);
    if (event.guild_id) {
        stmt.BindText(5, *event.guild_id);
    } else {
        sqlite3_bind_null(stmt.get(), 5);
    }
    stmt.BindText(6, destination_id);
    stmt.BindText(7, query);
    stmt.BindText(8, response);
    stmt.BindText(9, NowIso());
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StoreError(std::string("insert failed: ") + sqlite3_errmsg(db_));
    }
}

std::size_t SqliteMessageStore::CountExchanges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireOpen();
    Statement stmt(db_, "SELECT COUNT(*) FROM exchanges;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(std::string("count failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<ExchangeRecord> SqliteMessageStore::RecentExchanges(const std::string& channel_id,
                                                                std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireOpen();
    Statement stmt(db_,
        "SELECT id, event_id, author_id, author_name, channel_id, guild_id, destination_id, "
        "query, response, created_at FROM exchanges WHERE channel_id = ? "
        "ORDER BY id DESC LIMIT ?;");
    stmt.BindText(1, channel_id);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));
    return ReadRecords(stmt.get());
}

std::vector<ExchangeRecord> SqliteMessageStore::RecentExchangesForDestination(const std::string& destination_id,
                                                                              std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireOpen();
    // The opening exchange of a new thread is stored under its parent channel
    // with the thread as destination; follow-ups are stored under the thread.
    Statement stmt(db_,
        "SELECT id, event_id, author_id, author_name, channel_id, guild_id, destination_id, "
        "query, response, created_at FROM exchanges WHERE destination_id = ? OR channel_id = ? "
        "ORDER BY id DESC LIMIT ?;");
    stmt.BindText(1, destination_id);
    stmt.BindText(2, destination_id);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(limit));
    return ReadRecords(stmt.get());
}

void SqliteMessageStore::EnsureSchema() {
    if (db_) {
        return;
    }
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        utils::LogError(kTag, "failed to open sqlite db: " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    const bool created = Exec(db_, "CREATE TABLE IF NOT EXISTS exchanges ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "event_id TEXT NOT NULL,"
             "author_id TEXT NOT NULL,"
             "author_name TEXT,"
             "channel_id TEXT NOT NULL,"
             "guild_id TEXT,"
             "destination_id TEXT,"
             "query TEXT,"
             "response TEXT,"
             "created_at TEXT"
             ");");
    Exec(db_, "CREATE INDEX IF NOT EXISTS idx_exchanges_channel ON exchanges(channel_id);");
    Exec(db_, "CREATE INDEX IF NOT EXISTS idx_exchanges_destination ON exchanges(destination_id);");
    if (!created) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteMessageStore::RequireOpen() const {
    if (!db_) {
        throw StoreError("message store is not open: " + db_path_.string());
    }
}

bool SqliteMessageStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            utils::LogError(kTag, std::string("sqlite exec error: ") + err);
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::vector<ExchangeRecord> SqliteMessageStore::ReadRecords(sqlite3_stmt* stmt) {
    std::vector<ExchangeRecord> records;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ExchangeRecord record{};
        record.id = sqlite3_column_int64(stmt, 0);
        record.event_id = SafeText(sqlite3_column_text(stmt, 1));
        record.author_id = SafeText(sqlite3_column_text(stmt, 2));
        record.author_name = SafeText(sqlite3_column_text(stmt, 3));
        record.channel_id = SafeText(sqlite3_column_text(stmt, 4));
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            record.guild_id = SafeText(sqlite3_column_text(stmt, 5));
        }
        record.destination_id = SafeText(sqlite3_column_text(stmt, 6));
        record.query = SafeText(sqlite3_column_text(stmt, 7));
        record.response = SafeText(sqlite3_column_text(stmt, 8));
        record.created_at = SafeText(sqlite3_column_text(stmt, 9));
        records.push_back(std::move(record));
    }
    return records;
}

std::string SqliteMessageStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace tfbot::store
