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
#include <vector>

#include "mediasync/Types.h"

namespace mediasync
{

struct FormatDescriptor
{
    std::string formatId;
    /// 0 for audio only formats
    uint32_t height;
    uint32_t fps;
    /// Empty when the format carries no video
    std::string videoCodec;
    /// Empty when the format carries no audio
    std::string audioCodec;
};

/**
 * @brief The MediaDescriptor struct holds the metadata fetched for a media
 */
struct MediaDescriptor
{
    std::string title;
    std::string description;
    /// Unix timestamp, 0 if unknown
    int64_t uploadDate = 0;
    /// In seconds, 0 if unknown
    int64_t duration = 0;
    std::string thumbnailUrl;
    std::vector<FormatDescriptor> formats;
};

class IMedia
{
public:
    virtual ~IMedia() = default;

    virtual int64_t id() const = 0;
    virtual int64_t sourceId() const = 0;
    virtual SourcePtr source() const = 0;
    virtual const std::string& key() const = 0;
    /**
     * @brief title Returns the title from the metadata, or the key if no
     * metadata was fetched yet
     */
    virtual const std::string& title() const = 0;

    virtual bool hasMetadata() const = 0;
    /**
     * @brief metadata Returns the fetched metadata, or nullptr if none.
     */
    virtual const MediaDescriptor* metadata() const = 0;
    /**
     * @brief thumbnailUrl Returns the thumbnail URL from the metadata, or
     * an empty string
     */
    virtual const std::string& thumbnailUrl() const = 0;

    virtual bool isSkipped() const = 0;
    virtual bool isManuallySkipped() const = 0;
    virtual bool canDownload() const = 0;
    virtual bool isDownloaded() const = 0;
    /// Path to the downloaded file, empty if none
    virtual const std::string& mediaFile() const = 0;
    /// Path to the downloaded thumbnail, empty if none
    virtual const std::string& thumbnailFile() const = 0;

    virtual void setMetadata( MediaDescriptor metadata ) = 0;
    virtual void clearMetadata() = 0;
    virtual void setSkipped( bool skip ) = 0;
    virtual void setManuallySkipped( bool manualSkip ) = 0;
    /**
     * @brief setDownloaded Records the downloaded file. An empty path marks
     * the media as not downloaded.
     */
    virtual void setDownloaded( std::string mediaFile ) = 0;
    virtual void setThumbnailFile( std::string thumbnailFile ) = 0;

    /**
     * @brief save Persists the media, recomputing its derived flags and
     * scheduling the jobs it needs.
     * @return false if the database refused the change
     */
    virtual bool save() = 0;
};

}
