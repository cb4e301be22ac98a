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

#include <string>

#include "mediasync/Types.h"

namespace mediasync
{

/**
 * @brief The ISource class represents an upstream origin (a channel or a
 * playlist) owning zero or more media.
 *
 * Setters only buffer the change in memory. Nothing is written until save()
 * is called, which also runs the lifecycle rules bound to sources.
 */
class ISource
{
public:
    enum class Type : uint8_t
    {
        Channel,
        ChannelId,
        Playlist,
    };

    enum class Resolution : uint16_t
    {
        Audio = 0,
        P360 = 360,
        P480 = 480,
        P720 = 720,
        P1080 = 1080,
        P1440 = 1440,
        P2160 = 2160,
        P4320 = 4320,
    };

    enum class VideoCodec : uint8_t
    {
        AVC1,
        VP9,
    };

    enum class AudioCodec : uint8_t
    {
        MP4A,
        OPUS,
    };

    /// What to do when the requested resolution isn't available
    enum class Fallback : uint8_t
    {
        Fail,
        NextBest,
        NextBestHd,
    };

    virtual ~ISource() = default;

    virtual int64_t id() const = 0;
    virtual Type type() const = 0;
    virtual const std::string& key() const = 0;
    virtual const std::string& name() const = 0;
    virtual const std::string& directory() const = 0;
    /**
     * @brief indexSchedule Returns the indexing interval in seconds, or 0 when
     * the source is never indexed automatically
     */
    virtual uint32_t indexSchedule() const = 0;
    virtual bool downloadMedia() const = 0;
    virtual bool copyChannelImages() const = 0;
    virtual bool deleteFilesOnDisk() const = 0;
    /**
     * @brief hasFailed Returns true when indexing this source failed
     * permanently.
     */
    virtual bool hasFailed() const = 0;

    virtual const std::string& filterText() const = 0;
    virtual bool filterTextInvert() const = 0;
    /// Maximum age of a media, in seconds. 0 means no cap
    virtual uint32_t downloadCap() const = 0;
    virtual uint32_t minDuration() const = 0;
    virtual uint32_t maxDuration() const = 0;

    virtual Resolution resolution() const = 0;
    virtual VideoCodec videoCodec() const = 0;
    virtual AudioCodec audioCodec() const = 0;
    virtual bool prefer60fps() const = 0;
    virtual Fallback fallback() const = 0;

    virtual void setName( std::string name ) = 0;
    virtual void setDirectory( std::string directory ) = 0;
    virtual void setIndexSchedule( uint32_t schedule ) = 0;
    virtual void setDownloadMedia( bool downloadMedia ) = 0;
    virtual void setCopyChannelImages( bool copy ) = 0;
    virtual void setDeleteFilesOnDisk( bool deleteFiles ) = 0;
    virtual void setHasFailed( bool hasFailed ) = 0;
    virtual void setFilterText( std::string filterText, bool invert ) = 0;
    virtual void setDownloadCap( uint32_t cap ) = 0;
    virtual void setDurationLimits( uint32_t minDuration, uint32_t maxDuration ) = 0;
    virtual void setFormatPreferences( Resolution resolution, VideoCodec vcodec,
                                       AudioCodec acodec, bool prefer60fps,
                                       Fallback fallback ) = 0;

    /**
     * @brief save Persists the source, inserting it if it was never saved.
     * @return false if the database refused the change
     *
     * Database and collaborator errors are propagated as exceptions, in which
     * case nothing was persisted.
     */
    virtual bool save() = 0;
};

}
