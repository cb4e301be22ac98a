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

#include "Settings.h"

#include "database/SqliteTools.h"
#include "MediaSync.h"

namespace mediasync
{

const uint32_t Settings::DbModelVersion = 1u;
const uint32_t Settings::MaxTaskAttempts = 2u;
const uint32_t Settings::RetryBaseDelay = 5u;

Settings::Settings( MediaSync* ml )
    : m_ml( ml )
    , m_dbModelVersion( 0 )
    , m_maxTaskAttempts( MaxTaskAttempts )
    , m_retryBaseDelay( RetryBaseDelay )
    , m_escalateThumbnailFailures( false )
    , m_escalateDownloadFailures( false )
{
}

bool Settings::load()
{
    OPEN_READ_CONTEXT( ctx, m_ml->getConn() );
    sqlite::Statement s( "SELECT * FROM Settings" );
    s.execute();
    auto row = s.row();
    // First launch: no settings
    if ( row == nullptr )
    {
        if ( sqlite::Tools::executeInsert( m_ml->getConn(),
                "INSERT INTO Settings VALUES(?, ?, ?, ?, ?)",
                0u, MaxTaskAttempts, RetryBaseDelay, false, false ) == 0 )
        {
            return false;
        }
        m_dbModelVersion = 0;
        m_maxTaskAttempts = MaxTaskAttempts;
        m_retryBaseDelay = RetryBaseDelay;
        m_escalateThumbnailFailures = false;
        m_escalateDownloadFailures = false;
    }
    else
    {
        row >> m_dbModelVersion >> m_maxTaskAttempts >> m_retryBaseDelay
            >> m_escalateThumbnailFailures >> m_escalateDownloadFailures;
        // safety check: there sould only be one row
        assert( s.row() == nullptr );
    }
    return true;
}

template <typename T>
bool Settings::update( const char* column, T& member, T value )
{
    if ( member == value )
        return true;
    const std::string req = std::string{ "UPDATE Settings SET " } + column + " = ?";
    if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, value ) == false )
        return false;
    member = value;
    return true;
}

uint32_t Settings::dbModelVersion() const
{
    return m_dbModelVersion;
}

bool Settings::setDbModelVersion( uint32_t dbModelVersion )
{
    return update( "db_model_version", m_dbModelVersion, dbModelVersion );
}

uint32_t Settings::maxTaskAttempts() const
{
    return m_maxTaskAttempts;
}

bool Settings::setMaxTaskAttempts( uint32_t maxTaskAttempts )
{
    if ( maxTaskAttempts == 0 )
        return false;
    return update( "max_task_attempts", m_maxTaskAttempts, maxTaskAttempts );
}

uint32_t Settings::retryBaseDelay() const
{
    return m_retryBaseDelay;
}

bool Settings::setRetryBaseDelay( uint32_t delay )
{
    return update( "retry_base_delay", m_retryBaseDelay, delay );
}

bool Settings::escalateThumbnailFailures() const
{
    return m_escalateThumbnailFailures;
}

bool Settings::setEscalateThumbnailFailures( bool escalate )
{
    return update( "escalate_thumbnail_failures", m_escalateThumbnailFailures, escalate );
}

bool Settings::escalateDownloadFailures() const
{
    return m_escalateDownloadFailures;
}

bool Settings::setEscalateDownloadFailures( bool escalate )
{
    return update( "escalate_download_failures", m_escalateDownloadFailures, escalate );
}

void Settings::createTable( sqlite::Connection* dbConn )
{
    const std::string req = "CREATE TABLE IF NOT EXISTS Settings("
                "db_model_version UNSIGNED INTEGER NOT NULL,"
                "max_task_attempts UNSIGNED INTEGER NOT NULL,"
                "retry_base_delay UNSIGNED INTEGER NOT NULL,"
                "escalate_thumbnail_failures BOOLEAN NOT NULL,"
                "escalate_download_failures BOOLEAN NOT NULL"
            ")";
    sqlite::Tools::executeRequest( dbConn, req );
}

}
