#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace IpSift
{
namespace Store
{
    /// Connection, statement or constraint failure reported by a store.
    class StoreError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * ResultStore
     *
     * Document-store sink for extraction results. A collection holds one
     * document {"ip": "<address>"} per address.
     *
     * replaceCollection() is "delete everything, then insert the new set":
     * a reader may see the collection empty in between. It is not a
     * transaction spanning both collections.
     *
     * All operations throw StoreError on failure.
     */
    class ResultStore
    {
    public:
        virtual ~ResultStore() = default;

        /// Open the connection and verify it responds (ping).
        virtual void connect() = 0;

        virtual bool isConnected() const noexcept = 0;

        virtual void replaceCollection(const std::string &collection,
                                       const std::vector<std::string> &addresses) = 0;

        virtual std::size_t countDocuments(const std::string &collection) = 0;

        /// Stored addresses of a collection, in insertion order.
        virtual std::vector<std::string> listAddresses(const std::string &collection) = 0;

        virtual void close() noexcept = 0;
    };

} // namespace Store
} // namespace IpSift
