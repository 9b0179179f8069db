#ifndef PIIMASK_VAULT_SQLITE_TOKEN_STORE_HPP
#define PIIMASK_VAULT_SQLITE_TOKEN_STORE_HPP

#include <string>
#include <optional>
#include <stdexcept>
#include <sqlite3.h>
#include "token_store.hpp"
#include "../util/logger.hpp"

/**
 * @file sqlite_token_store.hpp
 * @brief A TokenStore persisted in a SQLite database file.
 *
 * DESIGN GOALS:
 *   - One table, "tokens", holding (seq, label, value). seq is an autoincrement key
 *     that records insertion order for forEach().
 *   - The connection is opened in the constructor and closed in the destructor.
 *   - Any SQLite failure throws std::runtime_error with SQLite's message attached.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto store = std::make_shared<piimask::vault::SqliteTokenStore>("session.vault");
 *   piimask::vault::TokenVault vault(store);
 *   @endcode
 */

namespace piimask {
namespace vault {

class SqliteTokenStore : public TokenStore
{
public:
    /**
     * @brief Open (or create) the vault database at dbFilePath.
     * @throw std::runtime_error if the database can't be opened or the schema can't be created.
     */
    explicit SqliteTokenStore(const std::string &dbFilePath)
        : m_dbFilePath(dbFilePath), m_db(nullptr)
    {
        int rc = sqlite3_open(m_dbFilePath.c_str(), &m_db);
        if (rc != SQLITE_OK || !m_db) {
            std::string reason = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) {
                sqlite3_close(m_db);
                m_db = nullptr;
            }
            throw std::runtime_error("[SqliteTokenStore] Could not open database " + m_dbFilePath
                                     + ": " + reason);
        }

        initDatabaseSchema();
        piimask::util::logger::debug("[SqliteTokenStore] Opened " + m_dbFilePath);
    }

    ~SqliteTokenStore() override
    {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    SqliteTokenStore(const SqliteTokenStore &) = delete;
    SqliteTokenStore &operator=(const SqliteTokenStore &) = delete;

    std::optional<std::string> get(const std::string &label) const override
    {
        Statement stmt(m_db, "SELECT value FROM tokens WHERE label = ?;");
        bindText(stmt.get(), 1, label);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw error("get");
        }
        return columnText(stmt.get(), 0);
    }

    void set(const std::string &label, const std::string &value) override
    {
        Statement update(m_db, "UPDATE tokens SET value = ? WHERE label = ?;");
        bindText(update.get(), 1, value);
        bindText(update.get(), 2, label);
        if (sqlite3_step(update.get()) != SQLITE_DONE) {
            throw error("set/update");
        }
        if (sqlite3_changes(m_db) > 0) {
            return;
        }

        Statement insert(m_db, "INSERT INTO tokens (label, value) VALUES (?, ?);");
        bindText(insert.get(), 1, label);
        bindText(insert.get(), 2, value);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw error("set/insert");
        }
    }

    void forEach(const Visitor &visit) const override
    {
        Statement stmt(m_db, "SELECT label, value FROM tokens ORDER BY seq;");

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            visit(columnText(stmt.get(), 0), columnText(stmt.get(), 1));
        }
        if (rc != SQLITE_DONE) {
            throw error("forEach");
        }
    }

    std::size_t size() const override
    {
        Statement stmt(m_db, "SELECT COUNT(*) FROM tokens;");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw error("size");
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    const std::string &path() const { return m_dbFilePath; }

private:
    // -------------------------------------------------------------------------
    // Owns one prepared statement; finalized on scope exit.
    // -------------------------------------------------------------------------
    class Statement
    {
    public:
        Statement(sqlite3 *db, const char *sql)
            : m_stmt(nullptr)
        {
            int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
            if (rc != SQLITE_OK || !m_stmt) {
                throw std::runtime_error(std::string("[SqliteTokenStore] prepare failed: ")
                                         + sqlite3_errmsg(db) + " (" + sql + ")");
            }
        }

        ~Statement() { sqlite3_finalize(m_stmt); }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        sqlite3_stmt *get() const { return m_stmt; }

    private:
        sqlite3_stmt *m_stmt;
    };

    void initDatabaseSchema()
    {
        const char *ddl = "CREATE TABLE IF NOT EXISTS tokens ("
                          " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " label TEXT NOT NULL UNIQUE,"
                          " value TEXT NOT NULL"
                          ");";

        char *errMsg = nullptr;
        int rc = sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string reason = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("[SqliteTokenStore] initDatabaseSchema error: " + reason);
        }
    }

    void bindText(sqlite3_stmt *stmt, int index, const std::string &text) const
    {
        int rc = sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()),
                                   SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            throw error("bind");
        }
    }

    static std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *text = sqlite3_column_text(stmt, col);
        int len = sqlite3_column_bytes(stmt, col);
        if (!text) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char *>(text), static_cast<std::size_t>(len));
    }

    std::runtime_error error(const std::string &op) const
    {
        return std::runtime_error("[SqliteTokenStore] " + op + " failed on " + m_dbFilePath
                                  + ": " + sqlite3_errmsg(m_db));
    }

    std::string m_dbFilePath;
    sqlite3 *m_db;
};

} // namespace vault
} // namespace piimask

#endif // PIIMASK_VAULT_SQLITE_TOKEN_STORE_HPP
