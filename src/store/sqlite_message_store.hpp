#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "store/message_store.hpp"

namespace tfbot::store {

class SqliteMessageStore : public MessageStore {
public:
    explicit SqliteMessageStore(std::filesystem::path db_path);
    ~SqliteMessageStore() override;

    SqliteMessageStore(const SqliteMessageStore&) = delete;
    SqliteMessageStore& operator=(const SqliteMessageStore&) = delete;

    void RecordExchange(const bus::InboundEvent& event,
                        const std::string& query,
                        const std::string& response,
                        const std::string& destination_id) override;

    std::size_t CountExchanges() const;

    // Newest first.
    std::vector<ExchangeRecord> RecentExchanges(const std::string& channel_id, std::size_t limit) const;

    std::vector<ExchangeRecord> RecentExchangesForDestination(const std::string& destination_id,
                                                              std::size_t limit) const override;

    bool IsOpen() const { return db_ != nullptr; }
    const std::filesystem::path& Path() const { return db_path_; }

private:
    void EnsureSchema();
    void RequireOpen() const;
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);
    static std::vector<ExchangeRecord> ReadRecords(sqlite3_stmt* stmt);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace tfbot::store
