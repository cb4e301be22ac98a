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

#include "Media.h"
#include "Metadata.h"
#include "MediaSync.h"
#include "Settings.h"
#include "Source.h"
#include "reconciler/Signals.h"

namespace mediasync
{

const std::string Media::Table::Name = "Media";
const std::string Media::Table::PrimaryKeyColumn = "id_media";
int64_t Media::* const Media::Table::PrimaryKey = &Media::m_id;

Media::Media( MediaSyncPtr ml, sqlite::Row& row )
    : m_ml( ml )
    , m_id( row.extract<decltype(m_id)>() )
    , m_sourceId( row.extract<decltype(m_sourceId)>() )
    , m_key( row.extract<decltype(m_key)>() )
    , m_hasMetadata( row.extract<decltype(m_hasMetadata)>() )
    , m_skip( row.extract<decltype(m_skip)>() )
    , m_manualSkip( row.extract<decltype(m_manualSkip)>() )
    , m_canDownload( row.extract<decltype(m_canDownload)>() )
    , m_downloaded( row.extract<decltype(m_downloaded)>() )
    , m_mediaFile( row.extract<decltype(m_mediaFile)>() )
    , m_thumbnailFile( row.extract<decltype(m_thumbnailFile)>() )
    , m_metadataLoaded( false )
    , m_metadataChanged( false )
    , m_changed( false )
{
    assert( row.hasRemainingColumns() == false );
}

Media::Media( MediaSyncPtr ml, int64_t sourceId, std::string key )
    : m_ml( ml )
    , m_id( 0 )
    , m_sourceId( sourceId )
    , m_key( std::move( key ) )
    , m_hasMetadata( false )
    , m_skip( false )
    , m_manualSkip( false )
    , m_canDownload( false )
    , m_downloaded( false )
    , m_metadataLoaded( true )
    , m_metadataChanged( false )
    , m_changed( true )
{
}

int64_t Media::id() const
{
    return m_id;
}

int64_t Media::sourceId() const
{
    return m_sourceId;
}

SourcePtr Media::source() const
{
    return Source::fetch( m_ml, m_sourceId );
}

const std::string& Media::key() const
{
    return m_key;
}

const std::string& Media::title() const
{
    auto m = metadata();
    if ( m == nullptr || m->title.empty() == true )
        return m_key;
    return m->title;
}

bool Media::hasMetadata() const
{
    return m_hasMetadata;
}

const MediaDescriptor* Media::metadata() const
{
    if ( m_hasMetadata == false )
        return nullptr;
    if ( m_metadataLoaded == false )
    {
        m_metadata = Metadata::load( m_ml, m_id );
        m_metadataLoaded = true;
    }
    return m_metadata.get();
}

const std::string& Media::thumbnailUrl() const
{
    static const std::string empty;
    auto m = metadata();
    if ( m == nullptr )
        return empty;
    return m->thumbnailUrl;
}

bool Media::isSkipped() const
{
    return m_skip;
}

bool Media::isManuallySkipped() const
{
    return m_manualSkip;
}

bool Media::canDownload() const
{
    return m_canDownload;
}

bool Media::isDownloaded() const
{
    return m_downloaded;
}

const std::string& Media::mediaFile() const
{
    return m_mediaFile;
}

const std::string& Media::thumbnailFile() const
{
    return m_thumbnailFile;
}

template <typename T>
void Media::assign( T& member, T value )
{
    if ( member == value )
        return;
    member = std::move( value );
    m_changed = true;
}

void Media::setMetadata( MediaDescriptor metadata )
{
    m_metadata.reset( new MediaDescriptor( std::move( metadata ) ) );
    m_metadataLoaded = true;
    m_metadataChanged = true;
    assign( m_hasMetadata, true );
}

void Media::clearMetadata()
{
    if ( m_hasMetadata == false )
        return;
    m_metadata.reset();
    m_metadataLoaded = true;
    m_metadataChanged = true;
    assign( m_hasMetadata, false );
}

void Media::setSkipped( bool skip )
{
    assign( m_skip, skip );
}

void Media::setManuallySkipped( bool manualSkip )
{
    assign( m_manualSkip, manualSkip );
}

void Media::setDownloaded( std::string mediaFile )
{
    auto downloaded = mediaFile.empty() == false;
    assign( m_mediaFile, std::move( mediaFile ) );
    assign( m_downloaded, downloaded );
}

void Media::setThumbnailFile( std::string thumbnailFile )
{
    assign( m_thumbnailFile, std::move( thumbnailFile ) );
}

void Media::setCanDownload( bool canDownload )
{
    assign( m_canDownload, canDownload );
}

bool Media::save()
{
    auto t = m_ml->getConn()->newTransaction();
    const auto& signal = m_ml->signals().media;
    if ( m_id == 0 )
    {
        signal.emit( LifecycleEvent::BeforeCreate, *this );
        static const std::string req = "INSERT INTO " + Table::Name +
                "(source_id, key, has_metadata, skip, manual_skip, can_download,"
                "downloaded, media_file, thumbnail_file) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?)";
        if ( insert( m_ml, *this, req, sqlite::ForeignKey{ m_sourceId }, m_key,
                     m_hasMetadata, m_skip, m_manualSkip, m_canDownload,
                     m_downloaded, sqlite::NullableString{ m_mediaFile },
                     sqlite::NullableString{ m_thumbnailFile } ) == false )
            return false;
        try
        {
            if ( m_metadata != nullptr &&
                 Metadata::store( m_ml, m_id, *m_metadata ) == false )
            {
                m_id = 0;
                return false;
            }
            signal.emit( LifecycleEvent::AfterCreate, *this );
        }
        catch ( const std::exception& )
        {
            // The insertion is about to be rolled back
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
            LOG_WARN( "Can't save media #", m_id, ": it was removed" );
            return false;
        }
        if ( m_changed == true )
        {
            static const std::string req = "UPDATE " + Table::Name + " SET "
                    "has_metadata = ?, skip = ?, manual_skip = ?, can_download = ?,"
                    "downloaded = ?, media_file = ?, thumbnail_file = ? "
                    "WHERE id_media = ?";
            if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, m_hasMetadata,
                        m_skip, m_manualSkip, m_canDownload, m_downloaded,
                        sqlite::NullableString{ m_mediaFile },
                        sqlite::NullableString{ m_thumbnailFile }, m_id ) == false )
                return false;
        }
        if ( m_metadataChanged == true )
        {
            auto res = m_metadata != nullptr ?
                        Metadata::store( m_ml, m_id, *m_metadata ) :
                        Metadata::clear( m_ml, m_id );
            if ( res == false )
                return false;
        }
        signal.emit( LifecycleEvent::AfterUpdate, *this, previous.get() );
    }
    t->commit();
    m_changed = false;
    m_metadataChanged = false;
    return true;
}

std::vector<std::shared_ptr<Media>> Media::fromSource( MediaSyncPtr ml, int64_t sourceId )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE source_id = ? ORDER BY id_media";
    return fetchAll<Media>( ml, req, sourceId );
}

bool Media::remove( MediaSyncPtr ml, int64_t mediaId )
{
    auto t = ml->getConn()->newTransaction();
    auto media = fetch( ml, mediaId );
    if ( media == nullptr )
        return false;
    const auto& signal = ml->signals().media;
    signal.emit( LifecycleEvent::BeforeDelete, *media );
    if ( destroy( ml, mediaId ) == false )
        return false;
    signal.emit( LifecycleEvent::AfterDelete, *media );
    t->commit();
    return true;
}

void Media::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

void Media::createIndexes( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   index( "source_id_idx", Settings::DbModelVersion ) );
}

std::string Media::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "id_media INTEGER PRIMARY KEY AUTOINCREMENT,"
        "source_id UNSIGNED INTEGER NOT NULL,"
        "key TEXT NOT NULL,"
        "has_metadata BOOLEAN NOT NULL DEFAULT 0,"
        "skip BOOLEAN NOT NULL DEFAULT 0,"
        "manual_skip BOOLEAN NOT NULL DEFAULT 0,"
        "can_download BOOLEAN NOT NULL DEFAULT 0,"
        "downloaded BOOLEAN NOT NULL DEFAULT 0,"
        "media_file TEXT,"
        "thumbnail_file TEXT,"
        "FOREIGN KEY(source_id) REFERENCES " + Source::Table::Name +
        "(id_source) ON DELETE CASCADE,"
        "UNIQUE(source_id, key) ON CONFLICT FAIL"
    ")";
}

std::string Media::index( const std::string& indexName, uint32_t )
{
    assert( indexName == "source_id_idx" );
    return "CREATE INDEX IF NOT EXISTS media_source_id_idx ON " +
            Table::Name + "(source_id)";
}

bool Media::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
