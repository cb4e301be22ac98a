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

class Source;

class Media : public IMedia, public DatabaseHelpers<Media>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
        static int64_t Media::*const PrimaryKey;
    };

    Media( MediaSyncPtr ml, sqlite::Row& row );
    Media( MediaSyncPtr ml, int64_t sourceId, std::string key );

    static void createTable( sqlite::Connection* dbConnection );
    static void createIndexes( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static std::string index( const std::string& indexName, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );

    static std::vector<std::shared_ptr<Media>> fromSource( MediaSyncPtr ml,
                                                           int64_t sourceId );
    /**
     * @brief remove Deletes a media, running the deletion rules
     * @return false if the media doesn't exist or couldn't be deleted
     */
    static bool remove( MediaSyncPtr ml, int64_t mediaId );

    virtual int64_t id() const override;
    virtual int64_t sourceId() const override;
    virtual SourcePtr source() const override;
    virtual const std::string& key() const override;
    virtual const std::string& title() const override;
    virtual bool hasMetadata() const override;
    virtual const MediaDescriptor* metadata() const override;
    virtual const std::string& thumbnailUrl() const override;
    virtual bool isSkipped() const override;
    virtual bool isManuallySkipped() const override;
    virtual bool canDownload() const override;
    virtual bool isDownloaded() const override;
    virtual const std::string& mediaFile() const override;
    virtual const std::string& thumbnailFile() const override;

    virtual void setMetadata( MediaDescriptor metadata ) override;
    virtual void clearMetadata() override;
    virtual void setSkipped( bool skip ) override;
    virtual void setManuallySkipped( bool manualSkip ) override;
    virtual void setDownloaded( std::string mediaFile ) override;
    virtual void setThumbnailFile( std::string thumbnailFile ) override;
    void setCanDownload( bool canDownload );

    virtual bool save() override;

private:
    template <typename T>
    void assign( T& member, T value );

private:
    MediaSyncPtr m_ml;

    int64_t m_id;
    const int64_t m_sourceId;
    const std::string m_key;
    bool m_hasMetadata;
    bool m_skip;
    bool m_manualSkip;
    bool m_canDownload;
    bool m_downloaded;
    std::string m_mediaFile;
    std::string m_thumbnailFile;

    // Lazily loaded
    mutable std::unique_ptr<MediaDescriptor> m_metadata;
    mutable bool m_metadataLoaded;
    bool m_metadataChanged;
    bool m_changed;

    friend struct Media::Table;
};

}
