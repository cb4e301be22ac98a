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

#include "mediasync/ISource.h"
#include "database/DatabaseHelpers.h"

namespace mediasync
{

class Media;

class Source : public ISource, public DatabaseHelpers<Source>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
        static int64_t Source::*const PrimaryKey;
    };

    Source( MediaSyncPtr ml, sqlite::Row& row );
    Source( MediaSyncPtr ml, Type type, std::string key, std::string name,
            std::string directory );

    static void createTable( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );
    /**
     * @brief remove Deletes the source, running the deletion rules
     * @return false if the source doesn't exist or couldn't be deleted
     */
    static bool remove( MediaSyncPtr ml, int64_t sourceId );

    virtual int64_t id() const override;
    virtual Type type() const override;
    virtual const std::string& key() const override;
    virtual const std::string& name() const override;
    virtual const std::string& directory() const override;
    virtual uint32_t indexSchedule() const override;
    virtual bool downloadMedia() const override;
    virtual bool copyChannelImages() const override;
    virtual bool deleteFilesOnDisk() const override;
    virtual bool hasFailed() const override;
    virtual const std::string& filterText() const override;
    virtual bool filterTextInvert() const override;
    virtual uint32_t downloadCap() const override;
    virtual uint32_t minDuration() const override;
    virtual uint32_t maxDuration() const override;
    virtual Resolution resolution() const override;
    virtual VideoCodec videoCodec() const override;
    virtual AudioCodec audioCodec() const override;
    virtual bool prefer60fps() const override;
    virtual Fallback fallback() const override;

    virtual void setName( std::string name ) override;
    virtual void setDirectory( std::string directory ) override;
    virtual void setIndexSchedule( uint32_t schedule ) override;
    virtual void setDownloadMedia( bool downloadMedia ) override;
    virtual void setCopyChannelImages( bool copy ) override;
    virtual void setDeleteFilesOnDisk( bool deleteFiles ) override;
    virtual void setHasFailed( bool hasFailed ) override;
    virtual void setFilterText( std::string filterText, bool invert ) override;
    virtual void setDownloadCap( uint32_t cap ) override;
    virtual void setDurationLimits( uint32_t minDuration, uint32_t maxDuration ) override;
    virtual void setFormatPreferences( Resolution resolution, VideoCodec vcodec,
                                       AudioCodec acodec, bool prefer60fps,
                                       Fallback fallback ) override;

    virtual bool save() override;

    /**
     * @brief media Returns the media owned by this source
     */
    std::vector<std::shared_ptr<Media>> media() const;
    /**
     * @brief queue Returns the task queue partition dedicated to this source
     */
    std::string queue() const;

private:
    template <typename T>
    void assign( T& member, T value );

private:
    MediaSyncPtr m_ml;

    int64_t m_id;
    const Type m_type;
    const std::string m_key;
    std::string m_name;
    std::string m_directory;
    uint32_t m_indexSchedule;
    bool m_downloadMedia;
    bool m_copyChannelImages;
    bool m_deleteFilesOnDisk;
    bool m_hasFailed;
    std::string m_filterText;
    bool m_filterTextInvert;
    uint32_t m_downloadCap;
    uint32_t m_minDuration;
    uint32_t m_maxDuration;
    Resolution m_resolution;
    VideoCodec m_videoCodec;
    AudioCodec m_audioCodec;
    bool m_prefer60fps;
    Fallback m_fallback;

    bool m_changed;

    friend struct Source::Table;
};

}
