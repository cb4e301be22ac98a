/*****************************************************************************
 * mediasync
 *****************************************************************************
 * Copyright (C) 2026 the mediasync authors
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation; either version 2.1 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program; if not, write to the Free Software Foundation,
 * Inc., 51 Franklin Street, Fifth Floor, Boston MA 02110-1301, USA.
 *****************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <unordered_map>
#include <string>

/*
 * Conditionally open a read context if no context is currently opened.
 * The first macro parameter is the context instance name, the 2nd a pointer to
 * a sqlite::Connection instance.
 * The resulting object must not be used as it may be default constructed if
 * a context was already opened.
 */
#define OPEN_READ_CONTEXT( name, dbConn ) \
    sqlite::Connection::ReadContext name; \
    if ( sqlite::Connection::Context::isOpened() == false ) { \
        name = dbConn->acquireReadContext(); \
    }

/*
 * Conditionally open a write context if no context is currently opened.
 * The first macro parameter is the context instance name, the 2nd a pointer to
 * a sqlite::Connection instance.
 * The resulting object must not be used as it may be default constructed if
 * a context was already opened.
 */
#define OPEN_WRITE_CONTEXT( name, dbConn ) \
    sqlite::Connection::WriteContext name; \
    if ( sqlite::Connection::Context::isOpened() == false ) { \
        name = dbConn->acquireWriteContext(); \
    }

namespace mediasync
{

namespace sqlite
{

class Transaction;

/**
 * @brief The Connection class wraps the sqlite handle
 *
 * Every access goes through a context. Contexts are exclusive: only one thread
 * can hold one at a time, which gives the single writer model the lifecycle
 * rules expect. A thread holding a context can recursively use the macros
 * above without deadlocking.
 */
class Connection : public std::enable_shared_from_this<Connection>
{
public:
    using Handle = sqlite3*;

    /**
     * @brief Represents a generic acquired context, which can be read or write
     *
     * This base class allows the caller to acquire a connection handle, which is
     * otherwise inaccessible.
     */
    class Context
    {
    public:
        Context() noexcept = default;
        ~Context();

        /**
         * @brief handle Returns the connection handle for the calling thread
         *
         * It is invalid to call this function if no context is opened
         */
        static Handle handle();
        /**
         * @brief isOpened Returns true if the calling thread has acquired a context
         */
        static bool isOpened();

    protected:
        void connect( Connection* c );
        void releaseHandle();

        Context( const Context& ) = delete;
        Context& operator=( const Context& ) = delete;
        Context( Context&& ctx ) noexcept;
        Context& operator=( Context&& ctx ) noexcept;

    private:
        static thread_local Handle m_handle;
        bool m_owning = false;
    };

    class ReadContext final : public Context
    {
    public:
        ReadContext() = default;
        ReadContext( Connection* c );
        ReadContext( const ReadContext& ) = delete;
        ReadContext& operator=( const ReadContext& ) = delete;
        ReadContext( ReadContext&& ) = default;
        ReadContext& operator=( ReadContext&& ) = default;
    private:
        std::unique_lock<std::mutex> m_lock;
    };

    class WriteContext final : public Context
    {
    public:
        WriteContext() = default;
        WriteContext( Connection* c );

        void unlock();

        WriteContext( const WriteContext& ) = delete;
        WriteContext& operator=( const WriteContext& ) = delete;
        WriteContext( WriteContext&& ) = default;
        WriteContext& operator=( WriteContext&& ) = default;

    private:
        std::unique_lock<std::mutex> m_lock;
    };

    enum class HookReason
    {
        Insert,
        Delete,
        Update
    };

    using UpdateHookCb = std::function<void(HookReason, int64_t)>;

    /**
     * @brief newTransaction Creates a transaction and acquires a write context
     * @return A transaction object
     *
     * This is safe to call recursively, only the first returned transaction
     * object will actually perform operations, the later will be noops, but will
     * not deadlock trying to acquire a second write context.
     */
    std::unique_ptr<sqlite::Transaction> newTransaction();
    ReadContext acquireReadContext();
    WriteContext acquireWriteContext();

    /**
     * @brief registerUpdateHook Register a hook on the provided table
     * @param table The table on which to hook
     * @param cb The callback to invoke when an event occurs on the given table
     *
     * This must be called before other threads use the connection.
     */
    void registerUpdateHook( const std::string& table, UpdateHookCb cb );
    bool checkSchemaIntegrity();
    bool checkForeignKeysIntegrity();
    const std::string& dbPath() const;

    static std::shared_ptr<Connection> connect( const std::string& dbPath );

protected:
    explicit Connection( const std::string& dbPath );
    ~Connection();

private:
    Connection( const Connection& ) = delete;
    Connection( Connection&& ) = delete;
    Connection& operator=( const Connection& ) = delete;
    Connection& operator=( Connection&& ) = delete;

    void setPragma( Handle conn, const std::string& pragmaName,
                    const std::string& value );

    // Opens the database on first use
    Handle handle();

    static void updateHook( void* data, int reason, const char* database,
                            const char* table, sqlite_int64 rowId );

private:
    /*
     * Wrapper object to sqlite_config calls, to ensure we call those only once
     * per process
     */
    struct SqliteConfigurator
    {
        SqliteConfigurator();
        SqliteConfigurator( const SqliteConfigurator& ) = delete;
        SqliteConfigurator& operator=( const SqliteConfigurator& ) = delete;
        SqliteConfigurator( SqliteConfigurator&& ) = delete;
        SqliteConfigurator& operator=( SqliteConfigurator&& ) = delete;
    };

    using ConnPtr = std::unique_ptr<sqlite3, int(*)(sqlite3*)>;
    std::string m_dbPath;
    ConnPtr m_conn;
    std::mutex m_contextLock;
    std::unordered_map<std::string, UpdateHookCb> m_hooks;
};

}

}
