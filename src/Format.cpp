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

#include "Format.h"
#include "Settings.h"

namespace mediasync
{

const std::string Format::Table::Name = "MediaFormat";
const std::string Format::Table::PrimaryKeyColumn = "id_format";
int64_t Format::* const Format::Table::PrimaryKey = &Format::m_id;

Format::Format( MediaSyncPtr, sqlite::Row& row )
    : m_id( row.extract<decltype(m_id)>() )
    , m_mediaId( row.extract<decltype(m_mediaId)>() )
    , m_formatId( row.extract<decltype(m_formatId)>() )
    , m_height( row.extract<decltype(m_height)>() )
    , m_fps( row.extract<decltype(m_fps)>() )
    , m_videoCodec( row.extract<decltype(m_videoCodec)>() )
    , m_audioCodec( row.extract<decltype(m_audioCodec)>() )
{
    assert( row.hasRemainingColumns() == false );
}

Format::Format( MediaSyncPtr, int64_t mediaId, const FormatDescriptor& desc )
    : m_id( 0 )
    , m_mediaId( mediaId )
    , m_formatId( desc.formatId )
    , m_height( desc.height )
    , m_fps( desc.fps )
    , m_videoCodec( desc.videoCodec )
    , m_audioCodec( desc.audioCodec )
{
}

int64_t Format::id() const
{
    return m_id;
}

int64_t Format::mediaId() const
{
    return m_mediaId;
}

FormatDescriptor Format::descriptor() const
{
    return FormatDescriptor{ m_formatId, m_height, m_fps, m_videoCodec, m_audioCodec };
}

std::shared_ptr<Format> Format::create( MediaSyncPtr ml, int64_t mediaId,
                                        const FormatDescriptor& desc )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(media_id, format_id, height, fps, video_codec, audio_codec) "
            "VALUES(?, ?, ?, ?, ?, ?)";
    auto format = std::make_shared<Format>( ml, mediaId, desc );
    if ( insert( ml, *format, req, mediaId, desc.formatId, desc.height,
                 desc.fps, desc.videoCodec, desc.audioCodec ) == false )
        return nullptr;
    return format;
}

std::vector<std::shared_ptr<Format>> Format::fromMedia( MediaSyncPtr ml, int64_t mediaId )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE media_id = ? ORDER BY id_format";
    return fetchAll<Format>( ml, req, mediaId );
}

bool Format::removeFromMedia( MediaSyncPtr ml, int64_t mediaId )
{
    static const std::string req = "DELETE FROM " + Table::Name + " "
            "WHERE media_id = ?";
    return sqlite::Tools::executeDelete( ml->getConn(), req, mediaId );
}

void Format::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

void Format::createIndexes( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   index( "media_id_idx", Settings::DbModelVersion ) );
}

std::string Format::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "id_format INTEGER PRIMARY KEY AUTOINCREMENT,"
        "media_id UNSIGNED INTEGER NOT NULL,"
        "format_id TEXT NOT NULL,"
        "height UNSIGNED INTEGER NOT NULL,"
        "fps UNSIGNED INTEGER NOT NULL,"
        "video_codec TEXT NOT NULL,"
        "audio_codec TEXT NOT NULL,"
        "FOREIGN KEY(media_id) REFERENCES Media(id_media) ON DELETE CASCADE"
    ")";
}

std::string Format::index( const std::string& indexName, uint32_t )
{
    assert( indexName == "media_id_idx" );
    return "CREATE INDEX IF NOT EXISTS format_media_id_idx ON " +
            Table::Name + "(media_id)";
}

bool Format::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
