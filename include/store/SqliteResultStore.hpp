#pragma once

#include <string>
#include <vector>

#include "store/ResultStore.hpp"

struct sqlite3;

namespace IpSift
{
namespace Store
{
    /**
     * SqliteResultStore
     *
     * ResultStore on an SQLite database. The connection URI is a filename,
     * a "file:" URI, or ":memory:".
     *
     * Layout: each collection is a table "<database>__<collection>"
     * (id INTEGER PRIMARY KEY, document TEXT NOT NULL) whose document column
     * holds the JSON text {"ip":"..."}. Tables are created on first use.
     * Database and collection names must match [A-Za-z0-9_]+ since they are
     * spliced into SQL; anything else is rejected with StoreError.
     *
     * One instance owns one connection and is used from one thread.
     */
    class SqliteResultStore : public ResultStore
    {
    public:
        SqliteResultStore(std::string connectionUri, std::string databaseName);

        SqliteResultStore(const SqliteResultStore &)            = delete;
        SqliteResultStore &operator=(const SqliteResultStore &) = delete;

        ~SqliteResultStore() override;

        void connect() override;
        bool isConnected() const noexcept override { return m_db != nullptr; }

        void replaceCollection(const std::string &collection,
                               const std::vector<std::string> &addresses) override;

        std::size_t countDocuments(const std::string &collection) override;

        std::vector<std::string> listAddresses(const std::string &collection) override;

        void close() noexcept override;

        const std::string &connectionUri() const noexcept { return m_uri; }

    private:
        std::string tableFor(const std::string &collection) const;
        void ensureTable(const std::string &table);
        void exec(const std::string &sql);
        sqlite3 *requireConnection() const;

    private:
        std::string m_uri;
        std::string m_database;
        sqlite3    *m_db = nullptr;
    };

} // namespace Store
} // namespace IpSift
