#include "store/SqliteResultStore.hpp"

#include <sqlite3.h>

#include <memory>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace IpSift
{
namespace Store
{
    namespace
    {
        struct StatementDeleter
        {
            void operator()(sqlite3_stmt *stmt) const noexcept { sqlite3_finalize(stmt); }
        };
        using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        Statement prepare(sqlite3 *db, const std::string &sql)
        {
            sqlite3_stmt *raw = nullptr;
            if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
            {
                sqlite3_finalize(raw);
                throw StoreError("prepare failed (" + sql + "): " + sqlite3_errmsg(db));
            }
            return Statement(raw);
        }

        std::string makeDocument(const std::string &address)
        {
            return "{\"ip\":\"" + Utils::escapeJson(address) + "\"}";
        }
    } // anonymous namespace

    SqliteResultStore::SqliteResultStore(std::string connectionUri, std::string databaseName)
        : m_uri(std::move(connectionUri)),
          m_database(std::move(databaseName))
    {
    }

    SqliteResultStore::~SqliteResultStore()
    {
        close();
    }

    void SqliteResultStore::connect()
    {
        if (m_db)
        {
            return;
        }
        if (!Utils::isIdentifier(m_database))
        {
            throw StoreError("invalid database name: '" + m_database + "'");
        }

        sqlite3 *db = nullptr;
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;
        const int rc = sqlite3_open_v2(m_uri.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK)
        {
            const std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            throw StoreError("cannot open store '" + m_uri + "': " + message);
        }
        m_db = db;

        // Ping: a trivial round trip proves the handle is usable.
        try
        {
            Statement ping = prepare(m_db, "SELECT 1");
            if (sqlite3_step(ping.get()) != SQLITE_ROW || sqlite3_column_int(ping.get(), 0) != 1)
            {
                throw StoreError(std::string("ping failed: ") + sqlite3_errmsg(m_db));
            }
        }
        catch (const StoreError &)
        {
            close();
            throw;
        }

        Utils::getLogger().info("Successfully connected to store " + m_uri);
    }

    void SqliteResultStore::close() noexcept
    {
        if (m_db)
        {
            sqlite3_close_v2(m_db);
            m_db = nullptr;
        }
    }

    sqlite3 *SqliteResultStore::requireConnection() const
    {
        if (!m_db)
        {
            throw StoreError("store is not connected");
        }
        return m_db;
    }

    std::string SqliteResultStore::tableFor(const std::string &collection) const
    {
        if (!Utils::isIdentifier(collection))
        {
            throw StoreError("invalid collection name: '" + collection + "'");
        }
        return m_database + "__" + collection;
    }

    void SqliteResultStore::exec(const std::string &sql)
    {
        char *errMsg = nullptr;
        if (sqlite3_exec(requireConnection(), sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK)
        {
            const std::string message = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw StoreError("statement failed (" + sql + "): " + message);
        }
    }

    void SqliteResultStore::ensureTable(const std::string &table)
    {
        exec("CREATE TABLE IF NOT EXISTS \"" + table +
             "\" (id INTEGER PRIMARY KEY, document TEXT NOT NULL)");
    }

    void SqliteResultStore::replaceCollection(const std::string &collection,
                                              const std::vector<std::string> &addresses)
    {
        sqlite3 *db = requireConnection();
        const std::string table = tableFor(collection);
        ensureTable(table);

        exec("DELETE FROM \"" + table + "\"");

        if (addresses.empty())
        {
            return;
        }

        // One transaction for the batch: a failed insert leaves the collection
        // empty rather than half filled.
        exec("BEGIN");
        try
        {
            Statement insert = prepare(db, "INSERT INTO \"" + table + "\" (document) VALUES (?1)");
            for (const auto &address : addresses)
            {
                const std::string document = makeDocument(address);
                if (sqlite3_bind_text(insert.get(), 1, document.c_str(),
                                      static_cast<int>(document.size()), SQLITE_TRANSIENT) != SQLITE_OK)
                {
                    throw StoreError("bind for " + table + " failed: " + sqlite3_errmsg(db));
                }
                if (sqlite3_step(insert.get()) != SQLITE_DONE)
                {
                    throw StoreError("insert into " + table + " failed: " + sqlite3_errmsg(db));
                }
                sqlite3_reset(insert.get());
                sqlite3_clear_bindings(insert.get());
            }
            exec("COMMIT");
        }
        catch (const StoreError &)
        {
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw;
        }

        Utils::getLogger().debug("Replaced " + table + " with " +
                                 std::to_string(addresses.size()) + " documents");
    }

    std::size_t SqliteResultStore::countDocuments(const std::string &collection)
    {
        sqlite3 *db = requireConnection();
        const std::string table = tableFor(collection);
        ensureTable(table);

        Statement count = prepare(db, "SELECT COUNT(*) FROM \"" + table + "\"");
        if (sqlite3_step(count.get()) != SQLITE_ROW)
        {
            throw StoreError("count on " + table + " failed: " + sqlite3_errmsg(db));
        }
        return static_cast<std::size_t>(sqlite3_column_int64(count.get(), 0));
    }

    std::vector<std::string> SqliteResultStore::listAddresses(const std::string &collection)
    {
        sqlite3 *db = requireConnection();
        const std::string table = tableFor(collection);
        ensureTable(table);

        Statement select = prepare(db, "SELECT json_extract(document, '$.ip') FROM \"" + table +
                                           "\" ORDER BY id");

        std::vector<std::string> out;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(select.get())) == SQLITE_ROW)
        {
            const auto *text = sqlite3_column_text(select.get(), 0);
            if (text)
            {
                out.emplace_back(reinterpret_cast<const char *>(text));
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw StoreError("select on " + table + " failed: " + sqlite3_errmsg(db));
        }
        return out;
    }

} // namespace Store
} // namespace IpSift
