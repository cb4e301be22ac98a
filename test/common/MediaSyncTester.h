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

#include "MediaSync.h"
#include "Media.h"
#include "MediaServer.h"
#include "Source.h"
#include "tasks/Task.h"

using namespace mediasync;

class MediaSyncTester : public MediaSync
{
public:
    // Use the IMediaSync getters by default
    using MediaSync::source;
    using MediaSync::media;
    std::shared_ptr<Source> source( int64_t id );
    std::shared_ptr<Media> media( int64_t id );

    std::shared_ptr<Source> addSource( const std::string& key, uint32_t indexSchedule = 0,
                                       ISource::Type type = ISource::Type::Channel );
    std::shared_ptr<Media> addMedia( const Source& source, const std::string& key );
    std::shared_ptr<MediaServer> addMediaServer( const std::string& host, uint16_t port );

    // Dispatch with an explicit clock
    std::shared_ptr<Task> nextTask( const std::string& queue, int64_t now );
    using MediaSync::nextTask;
    bool completeTask( int64_t taskId, int64_t now );
    bool failTask( int64_t taskId, const std::string& error, int64_t now );

    std::vector<std::shared_ptr<Task>> pending();
    std::shared_ptr<Task> pendingTask( ITask::Kind kind, int64_t targetId,
                                       const std::string& extra = {} );
    uint32_t countPending( ITask::Kind kind );
    uint32_t countPending( ITask::Kind kind, int64_t targetId );
    std::shared_ptr<Task> task( int64_t taskId );

    using MediaSync::signals;
    Signals& signals();
};
