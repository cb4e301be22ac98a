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

#include <memory>

#include "mediasync/IMedia.h"
#include "Types.h"

namespace mediasync
{

namespace sqlite
{
class Connection;
}

/**
 * @brief The Metadata class stores a media descriptor as a set of typed
 * records, and its formats in the MediaFormat table.
 */
class Metadata
{
public:
    struct Table
    {
        static const std::string Name;
    };

    enum class Type : uint8_t
    {
        Title,
        Description,
        UploadDate,
        Duration,
        ThumbnailUrl,
    };

    /**
     * @brief load Returns the descriptor stored for the given media, or
     * nullptr if no record exists
     */
    static std::unique_ptr<MediaDescriptor> load( MediaSyncPtr ml, int64_t mediaId );
    static bool store( MediaSyncPtr ml, int64_t mediaId, const MediaDescriptor& desc );
    static bool clear( MediaSyncPtr ml, int64_t mediaId );

    static void createTable( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );

private:
    static bool set( MediaSyncPtr ml, int64_t mediaId, Type type,
                     const std::string& value );
};

}
