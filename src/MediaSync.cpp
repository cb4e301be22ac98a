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

#include "MediaSync.h"

#include "Format.h"
#include "Media.h"
#include "MediaServer.h"
#include "Metadata.h"
#include "Source.h"
#include "database/SqliteConnection.h"
#include "database/SqliteTools.h"
#include "filesystem/unix/FileSystem.h"
#include "filters/FormatSelector.h"
#include "filters/MediaFilter.h"
#include "logging/Logger.h"
#include "reconciler/Reconciler.h"
#include "tasks/Task.h"
#include "tasks/TaskRegistry.h"

#include <ctime>

namespace mediasync
{

MediaSync::MediaSync()
    : m_initialized( false )
    , m_settings( this )
{
}

MediaSync::~MediaSync()
{
    // Don't leave a dangling logger behind
    if ( m_logger != nullptr )
        Log::SetLogger( nullptr );
}

void MediaSync::createAllTables()
{
    auto dbConn = m_dbConnection.get();

    Source::createTable( dbConn );
    Media::createTable( dbConn );
    Media::createIndexes( dbConn );
    Metadata::createTable( dbConn );
    Format::createTable( dbConn );
    Format::createIndexes( dbConn );
    MediaServer::createTable( dbConn );
    Task::createTable( dbConn );
    Task::createIndexes( dbConn );
}

bool MediaSync::checkDatabaseIntegrity()
{
    auto schemaOk = Source::checkDbModel( this ) &&
            Media::checkDbModel( this ) &&
            Metadata::checkDbModel( this ) &&
            Format::checkDbModel( this ) &&
            MediaServer::checkDbModel( this ) &&
            Task::checkDbModel( this );
    return schemaOk == true &&
            m_dbConnection->checkSchemaIntegrity() == true &&
            m_dbConnection->checkForeignKeysIntegrity() == true;
}

InitializeResult MediaSync::initialize( const std::string& dbPath,
                                        const SetupConfig* cfg )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_initialized == true )
        return InitializeResult::AlreadyInitialized;

    if ( cfg != nullptr )
    {
        if ( cfg->logger != nullptr )
        {
            m_logger = cfg->logger;
            Log::SetLogger( m_logger.get() );
        }
        Log::setLogLevel( cfg->logLevel );
        m_fileSystem = cfg->fileSystem;
        m_filterEngine = cfg->filterEngine;
        m_formatSelector = cfg->formatSelector;
    }
    if ( m_fileSystem == nullptr )
        m_fileSystem = std::make_shared<fs::LocalFileSystem>();
    if ( m_filterEngine == nullptr )
        m_filterEngine = std::make_shared<MediaFilter>();
    if ( m_formatSelector == nullptr )
        m_formatSelector = std::make_shared<FormatSelector>();

    LOG_INFO( "Initializing mediasync..." );
    LOG_INFO( "Current version is " PROJECT_VERSION ". Database model is ",
              Settings::DbModelVersion );

    try
    {
        m_dbConnection = sqlite::Connection::connect( dbPath );
        auto t = m_dbConnection->newTransaction();
        Settings::createTable( m_dbConnection.get() );
        if ( m_settings.load() == false )
        {
            LOG_ERROR( "Failed to load settings" );
            return InitializeResult::Failed;
        }
        auto dbModel = m_settings.dbModelVersion();
        if ( dbModel == 0 )
        {
            createAllTables();
            if ( m_settings.setDbModelVersion( Settings::DbModelVersion ) == false )
                return InitializeResult::Failed;
            t->commit();
        }
        else
        {
            t->commit();
            if ( dbModel != Settings::DbModelVersion )
            {
                LOG_ERROR( "Unsupported database model ", dbModel );
                return InitializeResult::Failed;
            }
            if ( checkDatabaseIntegrity() == false )
            {
                LOG_ERROR( "Database integrity check failed" );
                return InitializeResult::Failed;
            }
        }
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_ERROR( "Can't initialize mediasync: ", ex.what() );
        return InitializeResult::Failed;
    }

    m_registry.reset( new TaskRegistry( this ) );
    m_reconciler.reset( new Reconciler( this, m_signals ) );
    m_initialized = true;
    LOG_INFO( "Successfully initialized" );
    return InitializeResult::Success;
}

void MediaSync::setVerbosity( LogLevel v )
{
    Log::setLogLevel( v );
}

SourcePtr MediaSync::newSource( ISource::Type type, const std::string& key,
                                const std::string& name, const std::string& directory )
{
    return std::make_shared<Source>( this, type, key, name, directory );
}

SourcePtr MediaSync::source( int64_t sourceId ) const
{
    return Source::fetch( this, sourceId );
}

std::vector<SourcePtr> MediaSync::sources() const
{
    return Source::fetchAll<ISource>( this );
}

bool MediaSync::deleteSource( int64_t sourceId )
{
    return Source::remove( this, sourceId );
}

MediaPtr MediaSync::newMedia( int64_t sourceId, const std::string& key )
{
    if ( Source::fetch( this, sourceId ) == nullptr )
    {
        LOG_ERROR( "Can't create media ", key, ": unknown source #", sourceId );
        return nullptr;
    }
    return std::make_shared<Media>( this, sourceId, key );
}

MediaPtr MediaSync::media( int64_t mediaId ) const
{
    return Media::fetch( this, mediaId );
}

std::vector<MediaPtr> MediaSync::mediaForSource( int64_t sourceId ) const
{
    static const std::string req = "SELECT * FROM " + Media::Table::Name +
            " WHERE source_id = ? ORDER BY id_media";
    return Media::fetchAll<IMedia>( this, req, sourceId );
}

bool MediaSync::deleteMedia( int64_t mediaId )
{
    return Media::remove( this, mediaId );
}

MediaServerPtr MediaSync::newMediaServer( IMediaServer::Type type,
                                          const std::string& host, uint16_t port )
{
    return std::make_shared<MediaServer>( this, type, host, port );
}

std::vector<MediaServerPtr> MediaSync::mediaServers() const
{
    return MediaServer::fetchAll<IMediaServer>( this );
}

bool MediaSync::deleteMediaServer( int64_t serverId )
{
    return MediaServer::remove( this, serverId );
}

bool MediaSync::reconcileSourceMedia( int64_t sourceId )
{
    auto source = Source::fetch( this, sourceId );
    if ( source == nullptr )
    {
        LOG_WARN( "Can't reconcile media of unknown source #", sourceId );
        return false;
    }
    LOG_INFO( "Checking all media for source ", source->name() );
    auto res = true;
    for ( const auto& m : source->media() )
    {
        if ( m->save() == false )
        {
            LOG_WARN( "Failed to reconcile media ", m->title() );
            res = false;
        }
    }
    return res;
}

ITaskRegistry* MediaSync::taskRegistry()
{
    return m_registry.get();
}

TaskPtr MediaSync::nextTask( const std::string& queue )
{
    return m_registry->next( queue, time( nullptr ) );
}

std::vector<TaskPtr> MediaSync::pendingTasks() const
{
    auto tasks = m_registry->pending();
    return std::vector<TaskPtr>( begin( tasks ), end( tasks ) );
}

bool MediaSync::taskCompleted( int64_t taskId )
{
    return m_registry->complete( taskId, time( nullptr ) );
}

bool MediaSync::taskFailed( int64_t taskId, const std::string& error )
{
    return m_registry->fail( taskId, error, time( nullptr ) );
}

uint32_t MediaSync::maxTaskAttempts() const
{
    return m_settings.maxTaskAttempts();
}

bool MediaSync::setMaxTaskAttempts( uint32_t nbAttempts )
{
    return m_settings.setMaxTaskAttempts( nbAttempts );
}

uint32_t MediaSync::retryBaseDelay() const
{
    return m_settings.retryBaseDelay();
}

bool MediaSync::setRetryBaseDelay( uint32_t delay )
{
    return m_settings.setRetryBaseDelay( delay );
}

bool MediaSync::escalatesFailures( ITask::Kind kind ) const
{
    switch ( kind )
    {
        case ITask::Kind::DownloadMediaMetadata:
            return true;
        case ITask::Kind::DownloadMediaThumbnail:
            return m_settings.escalateThumbnailFailures();
        case ITask::Kind::DownloadMedia:
            return m_settings.escalateDownloadFailures();
        default:
            return false;
    }
}

bool MediaSync::setEscalateFailures( ITask::Kind kind, bool escalate )
{
    switch ( kind )
    {
        case ITask::Kind::DownloadMediaThumbnail:
            return m_settings.setEscalateThumbnailFailures( escalate );
        case ITask::Kind::DownloadMedia:
            return m_settings.setEscalateDownloadFailures( escalate );
        default:
            LOG_WARN( "Failures of task kind ", static_cast<int>( kind ),
                      " can't be configured" );
            return false;
    }
}

sqlite::Connection* MediaSync::getConn() const
{
    return m_dbConnection.get();
}

const Signals& MediaSync::signals() const
{
    return m_signals;
}

const Settings& MediaSync::settings() const
{
    return m_settings;
}

TaskRegistry& MediaSync::registry() const
{
    return *m_registry;
}

fs::IFileSystem& MediaSync::fileSystem() const
{
    return *m_fileSystem;
}

IFilterEngine& MediaSync::filterEngine() const
{
    return *m_filterEngine;
}

IFormatSelector& MediaSync::formatSelector() const
{
    return *m_formatSelector;
}

}

mediasync::IMediaSync* NewMediaSync()
{
    return new mediasync::MediaSync;
}
