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

class ITask
{
public:
    enum class Kind : uint8_t
    {
        IndexSource,
        CheckSourceDirectory,
        DownloadSourceImages,
        SaveAllMediaForSource,
        DownloadMediaMetadata,
        DownloadMediaThumbnail,
        DownloadMedia,
        RescanMediaServer,
    };

    enum class State : uint8_t
    {
        Pending,
        Running,
        Failed,
    };

    virtual ~ITask() = default;

    virtual int64_t id() const = 0;
    virtual Kind kind() const = 0;
    virtual int64_t targetId() const = 0;
    /// Extra key discriminator, ie. the thumbnail URL for thumbnail downloads
    virtual const std::string& extra() const = 0;
    virtual const std::string& queue() const = 0;
    virtual int32_t priority() const = 0;
    /// Repeat interval in seconds, 0 for one shot tasks
    virtual uint32_t repeatInterval() const = 0;
    virtual int64_t runAt() const = 0;
    virtual uint32_t attempts() const = 0;
    virtual State state() const = 0;
    virtual const std::string& verboseName() const = 0;
    virtual const std::string& lastError() const = 0;
};

/**
 * Dispatch priorities. Lower values are served first.
 */
namespace priority
{
static constexpr int32_t Bookkeeping = 0;
static constexpr int32_t Index = 5;
static constexpr int32_t Metadata = 5;
static constexpr int32_t Thumbnail = 10;
static constexpr int32_t Download = 15;
static constexpr int32_t Rescan = 0;
}

}
