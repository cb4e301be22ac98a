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

#include "mediasync/IMedia.h"
#include "database/DatabaseHelpers.h"

namespace mediasync
{

/**
 * @brief The Format class stores one of the formats a media is available in
 */
class Format : public DatabaseHelpers<Format>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
        static int64_t Format::*const PrimaryKey;
    };

    Format( MediaSyncPtr ml, sqlite::Row& row );
    Format( MediaSyncPtr ml, int64_t mediaId, const FormatDescriptor& desc );

    int64_t id() const;
    int64_t mediaId() const;
    FormatDescriptor descriptor() const;

    static std::shared_ptr<Format> create( MediaSyncPtr ml, int64_t mediaId,
                                           const FormatDescriptor& desc );
    static std::vector<std::shared_ptr<Format>> fromMedia( MediaSyncPtr ml,
                                                           int64_t mediaId );
    static bool removeFromMedia( MediaSyncPtr ml, int64_t mediaId );

    static void createTable( sqlite::Connection* dbConnection );
    static void createIndexes( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static std::string index( const std::string& indexName, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );

private:
    int64_t m_id;
    const int64_t m_mediaId;
    const std::string m_formatId;
    const uint32_t m_height;
    const uint32_t m_fps;
    const std::string m_videoCodec;
    const std::string m_audioCodec;

    friend struct Format::Table;
};

}
