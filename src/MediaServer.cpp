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

#include "MediaServer.h"
#include "MediaSync.h"
#include "Settings.h"
#include "reconciler/Signals.h"

namespace mediasync
{

const std::string MediaServer::Table::Name = "MediaServer";
const std::string MediaServer::Table::PrimaryKeyColumn = "id_media_server";
int64_t MediaServer::* const MediaServer::Table::PrimaryKey = &MediaServer::m_id;

MediaServer::MediaServer( MediaSyncPtr ml, sqlite::Row& row )
    : m_ml( ml )
    , m_id( row.extract<decltype(m_id)>() )
    , m_type( row.extract<decltype(m_type)>() )
    , m_host( row.extract<decltype(m_host)>() )
    , m_port( row.extract<decltype(m_port)>() )
    , m_useHttps( row.extract<decltype(m_useHttps)>() )
    , m_verifyHttps( row.extract<decltype(m_verifyHttps)>() )
    , m_options( row.extract<decltype(m_options)>() )
    , m_changed( false )
{
    assert( row.hasRemainingColumns() == false );
}

MediaServer::MediaServer( MediaSyncPtr ml, Type type, std::string host, uint16_t port )
    : m_ml( ml )
    , m_id( 0 )
    , m_type( type )
    , m_host( std::move( host ) )
    , m_port( port )
    , m_useHttps( false )
    , m_verifyHttps( true )
    , m_changed( true )
{
}

int64_t MediaServer::id() const
{
    return m_id;
}

IMediaServer::Type MediaServer::type() const
{
    return m_type;
}

const std::string& MediaServer::host() const
{
    return m_host;
}

uint16_t MediaServer::port() const
{
    return m_port;
}

bool MediaServer::useHttps() const
{
    return m_useHttps;
}

bool MediaServer::verifyHttps() const
{
    return m_verifyHttps;
}

const std::string& MediaServer::options() const
{
    return m_options;
}

std::string MediaServer::url() const
{
    return std::string{ m_useHttps ? "https://" : "http://" } + m_host + ':' +
            std::to_string( m_port );
}

void MediaServer::setHttps( bool useHttps, bool verifyHttps )
{
    if ( m_useHttps == useHttps && m_verifyHttps == verifyHttps )
        return;
    m_useHttps = useHttps;
    m_verifyHttps = verifyHttps;
    m_changed = true;
}

void MediaServer::setOptions( std::string options )
{
    if ( m_options == options )
        return;
    m_options = std::move( options );
    m_changed = true;
}

bool MediaServer::save()
{
    auto t = m_ml->getConn()->newTransaction();
    const auto& signal = m_ml->signals().mediaServer;
    if ( m_id == 0 )
    {
        signal.emit( LifecycleEvent::BeforeCreate, *this );
        static const std::string req = "INSERT INTO " + Table::Name +
                "(type, host, port, use_https, verify_https, options) "
                "VALUES(?, ?, ?, ?, ?, ?)";
        if ( insert( m_ml, *this, req, m_type, m_host, m_port, m_useHttps,
                     m_verifyHttps, m_options ) == false )
            return false;
        try
        {
            signal.emit( LifecycleEvent::AfterCreate, *this );
        }
        catch ( const std::exception& )
        {
            m_id = 0;
            throw;
        }
    }
    else
    {
        auto previous = fetch( m_ml, m_id );
        signal.emit( LifecycleEvent::BeforeUpdate, *this, previous.get() );
        if ( previous == nullptr )
        {
            LOG_WARN( "Can't save media server #", m_id, ": it was removed" );
            return false;
        }
        if ( m_changed == true )
        {
            static const std::string req = "UPDATE " + Table::Name + " SET "
                    "use_https = ?, verify_https = ?, options = ? "
                    "WHERE id_media_server = ?";
            if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, m_useHttps,
                                               m_verifyHttps, m_options, m_id ) == false )
                return false;
        }
        signal.emit( LifecycleEvent::AfterUpdate, *this, previous.get() );
    }
    t->commit();
    m_changed = false;
    return true;
}

bool MediaServer::remove( MediaSyncPtr ml, int64_t serverId )
{
    auto t = ml->getConn()->newTransaction();
    auto server = fetch( ml, serverId );
    if ( server == nullptr )
        return false;
    const auto& signal = ml->signals().mediaServer;
    signal.emit( LifecycleEvent::BeforeDelete, *server );
    if ( destroy( ml, serverId ) == false )
        return false;
    signal.emit( LifecycleEvent::AfterDelete, *server );
    t->commit();
    return true;
}

void MediaServer::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

std::string MediaServer::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "id_media_server INTEGER PRIMARY KEY AUTOINCREMENT,"
        "type UNSIGNED INTEGER NOT NULL,"
        "host TEXT NOT NULL,"
        "port UNSIGNED INTEGER NOT NULL,"
        "use_https BOOLEAN NOT NULL DEFAULT 0,"
        "verify_https BOOLEAN NOT NULL DEFAULT 1,"
        "options TEXT NOT NULL DEFAULT '',"
        "UNIQUE(host, port) ON CONFLICT FAIL"
    ")";
}

bool MediaServer::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
