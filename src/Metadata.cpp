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

#include "Metadata.h"
#include "Format.h"
#include "Settings.h"

#include "database/SqliteTools.h"

#include <cstdlib>

namespace mediasync
{

const std::string Metadata::Table::Name = "MediaMetadata";

std::unique_ptr<MediaDescriptor> Metadata::load( MediaSyncPtr ml, int64_t mediaId )
{
    static const std::string req = "SELECT type, value FROM " + Table::Name +
            " WHERE media_id = ?";
    std::unique_ptr<MediaDescriptor> desc;
    {
        OPEN_READ_CONTEXT( ctx, ml->getConn() );
        sqlite::Statement stmt( req );
        stmt.execute( mediaId );
        for ( sqlite::Row row = stmt.row(); row != nullptr; row = stmt.row() )
        {
            if ( desc == nullptr )
                desc.reset( new MediaDescriptor );
            auto type = row.load<Type>( 0 );
            auto value = row.load<std::string>( 1 );
            switch ( type )
            {
                case Type::Title:
                    desc->title = std::move( value );
                    break;
                case Type::Description:
                    desc->description = std::move( value );
                    break;
                case Type::UploadDate:
                    desc->uploadDate = atoll( value.c_str() );
                    break;
                case Type::Duration:
                    desc->duration = atoll( value.c_str() );
                    break;
                case Type::ThumbnailUrl:
                    desc->thumbnailUrl = std::move( value );
                    break;
                default:
                    LOG_WARN( "Ignoring unknown metadata type ",
                              static_cast<int>( type ), " for media #", mediaId );
                    break;
            }
        }
    }
    if ( desc == nullptr )
        return nullptr;
    for ( const auto& f : Format::fromMedia( ml, mediaId ) )
        desc->formats.push_back( f->descriptor() );
    return desc;
}

bool Metadata::store( MediaSyncPtr ml, int64_t mediaId, const MediaDescriptor& desc )
{
    auto t = ml->getConn()->newTransaction();
    if ( set( ml, mediaId, Type::Title, desc.title ) == false ||
         set( ml, mediaId, Type::Description, desc.description ) == false ||
         set( ml, mediaId, Type::UploadDate, std::to_string( desc.uploadDate ) ) == false ||
         set( ml, mediaId, Type::Duration, std::to_string( desc.duration ) ) == false ||
         set( ml, mediaId, Type::ThumbnailUrl, desc.thumbnailUrl ) == false )
        return false;
    if ( Format::removeFromMedia( ml, mediaId ) == false )
        return false;
    for ( const auto& f : desc.formats )
    {
        if ( Format::create( ml, mediaId, f ) == nullptr )
            return false;
    }
    t->commit();
    return true;
}

bool Metadata::clear( MediaSyncPtr ml, int64_t mediaId )
{
    static const std::string req = "DELETE FROM " + Table::Name +
            " WHERE media_id = ?";
    auto t = ml->getConn()->newTransaction();
    if ( sqlite::Tools::executeDelete( ml->getConn(), req, mediaId ) == false ||
         Format::removeFromMedia( ml, mediaId ) == false )
        return false;
    t->commit();
    return true;
}

bool Metadata::set( MediaSyncPtr ml, int64_t mediaId, Type type, const std::string& value )
{
    static const std::string req = "INSERT OR REPLACE INTO " + Table::Name +
            "(media_id, type, value) VALUES(?, ?, ?)";
    return sqlite::Tools::executeInsert( ml->getConn(), req, mediaId, type, value ) != 0;
}

void Metadata::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

std::string Metadata::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "media_id INTEGER,"
        "type INTEGER,"
        "value TEXT,"
        "PRIMARY KEY(media_id, type),"
        "FOREIGN KEY(media_id) REFERENCES Media(id_media) ON DELETE CASCADE"
    ")";
}

bool Metadata::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
