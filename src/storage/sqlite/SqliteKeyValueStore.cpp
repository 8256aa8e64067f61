#include "securevault/storage/sqlite/SqliteKeyValueStoreFactory.hpp"

#include "securevault/storage/IKeyValueStore.hpp"
#include "securevault/storage/StorageErrors.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <plog/Log.h>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::storage::sqlite
{
namespace
{

constexpr int g_kBusyTimeoutMs{ 5000 };

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StorageFailure(msg);
    }
}

// Rolls back on scope exit unless commit() ran, whatever unwinds through it.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db) : m_db{ db }
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ~Transaction()
    {
        if (!m_committed)
        {
            PLOGE << "storage: batch rolled back";
            (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        exec(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db;
    bool m_committed{ false };
};

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StorageFailure(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    (void)sqlite3_busy_timeout(db.get(), g_kBusyTimeoutMs);
    return db;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS kv ("
             " key TEXT PRIMARY KEY,"
             " value BLOB NOT NULL"
             ");");
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw StorageFailure(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw StorageFailure(sqliteErr(db, "storage: bind key failed"));
    }
}

void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view bytes)
{
    // A zero-length blob must still bind as a blob, never as NULL.
    static constexpr char kEmpty{ 0 };
    const void* data = bytes.empty() ? static_cast<const void*>(&kEmpty) : static_cast<const void*>(bytes.data());
    if (sqlite3_bind_blob(stmt, index, data, static_cast<int>(bytes.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw StorageFailure(sqliteErr(db, "storage: bind value failed"));
    }
}

void upsert(sqlite3* db, std::string_view key, std::string_view value)
{
    auto stmt = prepare(db, "INSERT INTO kv(key, value) VALUES (?, ?)"
                            " ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    bindText(db, stmt.get(), 1, key);
    bindBlob(db, stmt.get(), 2, value);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        throw StorageFailure(sqliteErr(db, "storage: upsert failed"));
    }
}

void erase(sqlite3* db, std::string_view key)
{
    auto stmt = prepare(db, "DELETE FROM kv WHERE key = ?;");
    bindText(db, stmt.get(), 1, key);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        throw StorageFailure(sqliteErr(db, "storage: delete failed"));
    }
}

class SqliteKeyValueStore final : public securevault::storage::IKeyValueStore
{
public:
    explicit SqliteKeyValueStore(const std::filesystem::path& dbPath) : m_db{ openDb(dbPath) }
    {
        ensureSchema(m_db.get());
        PLOGI << "storage: opened " << dbPath.string();
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const override
    {
        const std::lock_guard lock{ m_mutex };

        auto stmt = prepare(m_db.get(), "SELECT value FROM kv WHERE key = ?;");
        bindText(m_db.get(), stmt.get(), 1, key);

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        if (stepRc != SQLITE_ROW)
        {
            throw StorageFailure(sqliteErr(m_db.get(), "storage: select failed"));
        }

        const void* ptr = sqlite3_column_blob(stmt.get(), 0);
        const int bytes = sqlite3_column_bytes(stmt.get(), 0);
        if (bytes < 0 || (ptr == nullptr && bytes > 0))
        {
            throw StorageFailure("storage: invalid kv row");
        }
        if (bytes == 0)
        {
            return std::string{};
        }
        return std::string{ static_cast<const char*>(ptr), static_cast<std::size_t>(bytes) };
    }

    void set(std::string_view key, std::string_view value) override
    {
        const std::lock_guard lock{ m_mutex };
        upsert(m_db.get(), key, value);
    }

    void remove(std::string_view key) override
    {
        const std::lock_guard lock{ m_mutex };
        erase(m_db.get(), key);
    }

    void apply(const std::vector<Mutation>& batch) override
    {
        const std::lock_guard lock{ m_mutex };

        Transaction txn{ m_db.get() };
        for (const auto& m : batch)
        {
            if (m.value)
            {
                upsert(m_db.get(), m.key, *m.value);
            }
            else
            {
                erase(m_db.get(), m.key);
            }
        }
        txn.commit();
    }

private:
    mutable std::mutex m_mutex;
    SqliteDbPtr m_db;
};

} // namespace

std::unique_ptr<securevault::storage::IKeyValueStore> makeSqliteKeyValueStore(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteKeyValueStore>(dbPath);
}

} // namespace securevault::storage::sqlite
