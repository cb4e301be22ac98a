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

#include "Source.h"
#include "Media.h"
#include "MediaSync.h"
#include "reconciler/Signals.h"
#include "Settings.h"

namespace mediasync
{

const std::string Source::Table::Name = "Source";
const std::string Source::Table::PrimaryKeyColumn = "id_source";
int64_t Source::* const Source::Table::PrimaryKey = &Source::m_id;

Source::Source( MediaSyncPtr ml, sqlite::Row& row )
    : m_ml( ml )
    , m_id( row.extract<decltype(m_id)>() )
    , m_type( row.extract<decltype(m_type)>() )
    , m_key( row.extract<decltype(m_key)>() )
    , m_name( row.extract<decltype(m_name)>() )
    , m_directory( row.extract<decltype(m_directory)>() )
    , m_indexSchedule( row.extract<decltype(m_indexSchedule)>() )
    , m_downloadMedia( row.extract<decltype(m_downloadMedia)>() )
    , m_copyChannelImages( row.extract<decltype(m_copyChannelImages)>() )
    , m_deleteFilesOnDisk( row.extract<decltype(m_deleteFilesOnDisk)>() )
    , m_hasFailed( row.extract<decltype(m_hasFailed)>() )
    , m_filterText( row.extract<decltype(m_filterText)>() )
    , m_filterTextInvert( row.extract<decltype(m_filterTextInvert)>() )
    , m_downloadCap( row.extract<decltype(m_downloadCap)>() )
    , m_minDuration( row.extract<decltype(m_minDuration)>() )
    , m_maxDuration( row.extract<decltype(m_maxDuration)>() )
    , m_resolution( row.extract<decltype(m_resolution)>() )
    , m_videoCodec( row.extract<decltype(m_videoCodec)>() )
    , m_audioCodec( row.extract<decltype(m_audioCodec)>() )
    , m_prefer60fps( row.extract<decltype(m_prefer60fps)>() )
    , m_fallback( row.extract<decltype(m_fallback)>() )
    , m_changed( false )
{
    assert( row.hasRemainingColumns() == false );
}

Source::Source( MediaSyncPtr ml, Type type, std::string key, std::string name,
                std::string directory )
    : m_ml( ml )
    , m_id( 0 )
    , m_type( type )
    , m_key( std::move( key ) )
    , m_name( std::move( name ) )
    , m_directory( std::move( directory ) )
    , m_indexSchedule( 0 )
    , m_downloadMedia( true )
    , m_copyChannelImages( false )
    , m_deleteFilesOnDisk( false )
    , m_hasFailed( false )
    , m_filterTextInvert( false )
    , m_downloadCap( 0 )
    , m_minDuration( 0 )
    , m_maxDuration( 0 )
    , m_resolution( Resolution::P1080 )
    , m_videoCodec( VideoCodec::VP9 )
    , m_audioCodec( AudioCodec::OPUS )
    , m_prefer60fps( true )
    , m_fallback( Fallback::NextBestHd )
    , m_changed( true )
{
}

int64_t Source::id() const
{
    return m_id;
}

ISource::Type Source::type() const
{
    return m_type;
}

const std::string& Source::key() const
{
    return m_key;
}

const std::string& Source::name() const
{
    return m_name;
}

const std::string& Source::directory() const
{
    return m_directory;
}

uint32_t Source::indexSchedule() const
{
    return m_indexSchedule;
}

bool Source::downloadMedia() const
{
    return m_downloadMedia;
}

bool Source::copyChannelImages() const
{
    return m_copyChannelImages;
}

bool Source::deleteFilesOnDisk() const
{
    return m_deleteFilesOnDisk;
}

bool Source::hasFailed() const
{
    return m_hasFailed;
}

const std::string& Source::filterText() const
{
    return m_filterText;
}

bool Source::filterTextInvert() const
{
    return m_filterTextInvert;
}

uint32_t Source::downloadCap() const
{
    return m_downloadCap;
}

uint32_t Source::minDuration() const
{
    return m_minDuration;
}

uint32_t Source::maxDuration() const
{
    return m_maxDuration;
}

ISource::Resolution Source::resolution() const
{
    return m_resolution;
}

ISource::VideoCodec Source::videoCodec() const
{
    return m_videoCodec;
}

ISource::AudioCodec Source::audioCodec() const
{
    return m_audioCodec;
}

bool Source::prefer60fps() const
{
    return m_prefer60fps;
}

ISource::Fallback Source::fallback() const
{
    return m_fallback;
}

template <typename T>
void Source::assign( T& member, T value )
{
    if ( member == value )
        return;
    member = std::move( value );
    m_changed = true;
}

void Source::setName( std::string name )
{
    assign( m_name, std::move( name ) );
}

void Source::setDirectory( std::string directory )
{
    assign( m_directory, std::move( directory ) );
}

void Source::setIndexSchedule( uint32_t schedule )
{
    assign( m_indexSchedule, schedule );
}

void Source::setDownloadMedia( bool downloadMedia )
{
    assign( m_downloadMedia, downloadMedia );
}

void Source::setCopyChannelImages( bool copy )
{
    assign( m_copyChannelImages, copy );
}

void Source::setDeleteFilesOnDisk( bool deleteFiles )
{
    assign( m_deleteFilesOnDisk, deleteFiles );
}

void Source::setHasFailed( bool hasFailed )
{
    assign( m_hasFailed, hasFailed );
}

void Source::setFilterText( std::string filterText, bool invert )
{
    assign( m_filterText, std::move( filterText ) );
    assign( m_filterTextInvert, invert );
}

void Source::setDownloadCap( uint32_t cap )
{
    assign( m_downloadCap, cap );
}

void Source::setDurationLimits( uint32_t minDuration, uint32_t maxDuration )
{
    assign( m_minDuration, minDuration );
    assign( m_maxDuration, maxDuration );
}

void Source::setFormatPreferences( Resolution resolution, VideoCodec vcodec,
                                   AudioCodec acodec, bool prefer60fps,
                                   Fallback fallback )
{
    assign( m_resolution, resolution );
    assign( m_videoCodec, vcodec );
    assign( m_audioCodec, acodec );
    assign( m_prefer60fps, prefer60fps );
    assign( m_fallback, fallback );
}

bool Source::save()
{
    auto t = m_ml->getConn()->newTransaction();
    const auto& signal = m_ml->signals().source;
    if ( m_id == 0 )
    {
        signal.emit( LifecycleEvent::BeforeCreate, *this );
        static const std::string req = "INSERT INTO " + Table::Name +
                "(source_type, key, name, directory, index_schedule, download_media,"
                "copy_channel_images, delete_files_on_disk, has_failed, filter_text,"
                "filter_text_invert, download_cap, min_duration, max_duration,"
                "resolution, video_codec, audio_codec, prefer_60fps, fallback) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
        if ( insert( m_ml, *this, req, m_type, m_key, m_name, m_directory,
                     m_indexSchedule, m_downloadMedia, m_copyChannelImages,
                     m_deleteFilesOnDisk, m_hasFailed, m_filterText,
                     m_filterTextInvert, m_downloadCap, m_minDuration,
                     m_maxDuration, m_resolution, m_videoCodec, m_audioCodec,
                     m_prefer60fps, m_fallback ) == false )
            return false;
        try
        {
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
            LOG_WARN( "Can't save source #", m_id, ": it was removed" );
            return false;
        }
        if ( m_changed == true )
        {
            static const std::string req = "UPDATE " + Table::Name + " SET "
                    "name = ?, directory = ?, index_schedule = ?, download_media = ?,"
                    "copy_channel_images = ?, delete_files_on_disk = ?, has_failed = ?,"
                    "filter_text = ?, filter_text_invert = ?, download_cap = ?,"
                    "min_duration = ?, max_duration = ?, resolution = ?,"
                    "video_codec = ?, audio_codec = ?, prefer_60fps = ?, fallback = ? "
                    "WHERE id_source = ?";
            if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, m_name,
                        m_directory, m_indexSchedule, m_downloadMedia,
                        m_copyChannelImages, m_deleteFilesOnDisk, m_hasFailed,
                        m_filterText, m_filterTextInvert, m_downloadCap,
                        m_minDuration, m_maxDuration, m_resolution,
                        m_videoCodec, m_audioCodec, m_prefer60fps, m_fallback,
                        m_id ) == false )
                return false;
        }
        signal.emit( LifecycleEvent::AfterUpdate, *this, previous.get() );
    }
    t->commit();
    m_changed = false;
    return true;
}

std::vector<std::shared_ptr<Media>> Source::media() const
{
    return Media::fromSource( m_ml, m_id );
}

std::string Source::queue() const
{
    return std::to_string( m_id );
}

bool Source::remove( MediaSyncPtr ml, int64_t sourceId )
{
    auto t = ml->getConn()->newTransaction();
    auto source = fetch( ml, sourceId );
    if ( source == nullptr )
        return false;
    const auto& signal = ml->signals().source;
    signal.emit( LifecycleEvent::BeforeDelete, *source );
    if ( destroy( ml, sourceId ) == false )
        return false;
    signal.emit( LifecycleEvent::AfterDelete, *source );
    t->commit();
    return true;
}

void Source::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

std::string Source::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "id_source INTEGER PRIMARY KEY AUTOINCREMENT,"
        "source_type UNSIGNED INTEGER NOT NULL,"
        "key TEXT NOT NULL,"
        "name TEXT NOT NULL,"
        "directory TEXT NOT NULL,"
        "index_schedule UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "download_media BOOLEAN NOT NULL DEFAULT 1,"
        "copy_channel_images BOOLEAN NOT NULL DEFAULT 0,"
        "delete_files_on_disk BOOLEAN NOT NULL DEFAULT 0,"
        "has_failed BOOLEAN NOT NULL DEFAULT 0,"
        "filter_text TEXT NOT NULL DEFAULT '',"
        "filter_text_invert BOOLEAN NOT NULL DEFAULT 0,"
        "download_cap UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "min_duration UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "max_duration UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "resolution UNSIGNED INTEGER NOT NULL,"
        "video_codec UNSIGNED INTEGER NOT NULL,"
        "audio_codec UNSIGNED INTEGER NOT NULL,"
        "prefer_60fps BOOLEAN NOT NULL,"
        "fallback UNSIGNED INTEGER NOT NULL,"
        "UNIQUE(source_type, key) ON CONFLICT FAIL"
    ")";
}

bool Source::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
