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

#if HAVE_CONFIG_H
# include "config.h"
#endif

#include "SqliteConnection.h"

#include "database/SqliteTools.h"

#include <cassert>

namespace mediasync
{
namespace sqlite
{

thread_local Connection::Handle Connection::Context::m_handle;

Connection::Connection( const std::string& dbPath )
    : m_dbPath( dbPath )
    , m_conn( nullptr, &sqlite3_close )
{
    /* Indirect call to sqlite3_config */
    static SqliteConfigurator config;
}

Connection::~Connection()
{
    sqlite::Statement::FlushConnectionStatementCache( m_conn.get() );
}

Connection::Handle Connection::handle()
{
    // Only invoked with m_contextLock held
    if ( m_conn != nullptr )
        return m_conn.get();
    sqlite3* dbConnection;
    auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    auto res = sqlite3_open_v2( m_dbPath.c_str(), &dbConnection, flags, nullptr );
    ConnPtr dbConn( dbConnection, &sqlite3_close );
    if ( res != SQLITE_OK )
    {
        int err = sqlite3_system_errno( dbConnection );
        LOG_ERROR( "Failed to connect to database. OS error: ", err );
        errors::mapToException( "<connecting to db>", "", res );
    }
    res = sqlite3_extended_result_codes( dbConnection, 1 );
    if ( res != SQLITE_OK )
        errors::mapToException( "<enabling extended errors>", "", res );
    // Another process may still hold the database
    sqlite3_busy_timeout( dbConnection, 5000 );
    setPragma( dbConnection, "foreign_keys", "1" );
    setPragma( dbConnection, "recursive_triggers", "1" );
    sqlite3_update_hook( dbConnection, &updateHook, this );
    m_conn = std::move( dbConn );
    LOG_DEBUG( "Connected to database ", m_dbPath );
    return m_conn.get();
}

std::unique_ptr<sqlite::Transaction> Connection::newTransaction()
{
    if ( sqlite::Transaction::isInProgress() == false )
        return std::unique_ptr<sqlite::Transaction>{ new sqlite::ActualTransaction( this ) };
    return std::unique_ptr<sqlite::Transaction>{ new sqlite::NoopTransaction() };
}

Connection::ReadContext Connection::acquireReadContext()
{
    assert( Context::isOpened() == false );
    return ReadContext{ this };
}

Connection::WriteContext Connection::acquireWriteContext()
{
    assert( Context::isOpened() == false );
    return WriteContext{ this };
}

void Connection::setPragma( Connection::Handle conn, const std::string& pragmaName,
                            const std::string& value )
{
    std::string reqBase = std::string{ "PRAGMA " } + pragmaName;
    std::string reqSet = reqBase + " = " + value;

    sqlite::Statement stmt( conn, reqSet );
    stmt.execute();
    if ( stmt.row() != nullptr )
        throw std::runtime_error( "Failed to enable/disable " + pragmaName );

    sqlite::Statement stmtCheck( conn, reqBase );
    stmtCheck.execute();
    auto resultRow = stmtCheck.row();
    std::string resultValue;
    resultRow >> resultValue;
    if( resultValue != value )
        throw std::runtime_error( "PRAGMA " + pragmaName + " value mismatch" );
}

void Connection::registerUpdateHook( const std::string& table, Connection::UpdateHookCb cb )
{
    m_hooks.emplace( table, std::move( cb ) );
}

bool Connection::checkSchemaIntegrity()
{
    OPEN_READ_CONTEXT( ctx, this );
    sqlite::Statement stmt( "PRAGMA integrity_check" );
    stmt.execute();
    auto row = stmt.row();
    if ( row.load<std::string>( 0 ) == "ok" )
    {
        while ( stmt.row() != nullptr )
            ;
        return true;
    }
    do
    {
        LOG_ERROR( "Error string from integrity_check: ", row.load<std::string>( 0 ) );
        row = stmt.row();
    }
    while ( row != nullptr );
    return false;
}

bool Connection::checkForeignKeysIntegrity()
{
    OPEN_READ_CONTEXT( ctx, this );
    sqlite::Statement stmt( "PRAGMA foreign_key_check" );
    stmt.execute();
    auto row = stmt.row();
    if ( row == nullptr )
        return true;
    do
    {
        auto table = row.extract<std::string>();
        auto rowid = row.extract<int64_t>();
        auto targetTable = row.extract<std::string>();
        auto idx = row.extract<int64_t>();
        LOG_ERROR( "Foreign Key error: In table ", table, " rowid: ", rowid,
                   " referring to table ", targetTable, " at index ", idx );
        row = stmt.row();
    }
    while ( row != nullptr );
    return false;
}

const std::string& Connection::dbPath() const
{
    return m_dbPath;
}

std::shared_ptr<Connection> Connection::connect( const std::string& dbPath )
{
    // Use a wrapper to allow make_shared to use the private Connection ctor
    struct SqliteConnectionWrapper : public Connection
    {
        explicit SqliteConnectionWrapper( const std::string& p ) : Connection( p ) {}
    };
    return std::make_shared<SqliteConnectionWrapper>( dbPath );
}

void Connection::updateHook( void* data, int reason, const char*,
                             const char* table, sqlite_int64 rowId )
{
    const auto self = reinterpret_cast<Connection*>( data );
    auto it = self->m_hooks.find( table );
    if ( it == end( self->m_hooks ) )
        return;
    switch ( reason )
    {
    case SQLITE_INSERT:
        it->second( HookReason::Insert, rowId );
        break;
    case SQLITE_UPDATE:
        it->second( HookReason::Update, rowId );
        break;
    case SQLITE_DELETE:
        it->second( HookReason::Delete, rowId );
        break;
    }
}

Connection::SqliteConfigurator::SqliteConfigurator()
{
    if ( sqlite3_threadsafe() == 0 )
        throw std::runtime_error( "SQLite isn't built with threadsafe mode" );
    if ( sqlite3_config( SQLITE_CONFIG_MULTITHREAD ) == SQLITE_ERROR )
        throw std::runtime_error( "Failed to enable sqlite multithreaded mode" );
}

Connection::Context::~Context()
{
    releaseHandle();
}

Connection::Handle Connection::Context::handle()
{
    assert( m_handle != nullptr );
    return m_handle;
}

bool Connection::Context::isOpened()
{
    return m_handle != nullptr;
}

void Connection::Context::connect( Connection* c )
{
    assert( m_handle == nullptr );
    m_handle = c->handle();
    m_owning = true;
}

void Connection::Context::releaseHandle()
{
    /*
     * We don't want to unset the current thread's context when destroying
     * a default constructed Context
     */
    if ( m_owning == false )
        return;
    m_handle = nullptr;
    m_owning = false;
}

Connection::Context::Context( Context&& ctx ) noexcept
{
    *this = std::move( ctx );
}

Connection::Context& Connection::Context::operator=( Context&& ctx ) noexcept
{
    m_owning = ctx.m_owning;
    ctx.m_owning = false;
    return *this;
}

Connection::ReadContext::ReadContext( Connection* c )
    : m_lock( c->m_contextLock )
{
    connect( c );
}

Connection::WriteContext::WriteContext( Connection* c )
    : m_lock( c->m_contextLock )
{
    connect( c );
}

void Connection::WriteContext::unlock()
{
    releaseHandle();
    m_lock.unlock();
}

}

}
