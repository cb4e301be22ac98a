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
#include "mediasync/ILogger.h"
#include "mediasync/ISource.h"
#include "mediasync/IMedia.h"
#include "mediasync/IMediaServer.h"
#include "mediasync/ITask.h"

namespace mediasync
{

enum class InitializeResult
{
    //< Everything worked out fine
    Success,
    //< Should be considered the same as Success, but is an indication of
    // unrequired subsequent calls to initialize.
    AlreadyInitialized,
    //< A fatal error occurred, the IMediaSync instance should be destroyed
    Failed,
};

struct SetupConfig
{
    LogLevel logLevel = LogLevel::Error;
    /**
     * An ILogger instance. If none is provided, logs go to the standard
     * output.
     */
    std::shared_ptr<ILogger> logger;
    /**
     * Collaborators queried by the lifecycle rules. Any one left null is
     * replaced by the default implementation.
     */
    std::shared_ptr<fs::IFileSystem> fileSystem;
    std::shared_ptr<IFilterEngine> filterEngine;
    std::shared_ptr<IFormatSelector> formatSelector;
};

class IMediaSync
{
public:
    virtual ~IMediaSync() = default;

    /**
     * @brief initialize Opens or creates the database and wires the
     * lifecycle rules.
     * @param dbPath Path to the database file
     * @param cfg An optional configuration. Can be nullptr.
     */
    virtual InitializeResult initialize( const std::string& dbPath,
                                         const SetupConfig* cfg ) = 0;
    virtual void setVerbosity( LogLevel v ) = 0;

    /**
     * @brief newSource Returns an unsaved source. It is inserted on its first
     * call to save()
     */
    virtual SourcePtr newSource( ISource::Type type, const std::string& key,
                                 const std::string& name,
                                 const std::string& directory ) = 0;
    virtual SourcePtr source( int64_t sourceId ) const = 0;
    virtual std::vector<SourcePtr> sources() const = 0;
    /**
     * @brief deleteSource Deletes a source and every media it owns, releasing
     * their jobs and, if configured, their files.
     */
    virtual bool deleteSource( int64_t sourceId ) = 0;

    virtual MediaPtr newMedia( int64_t sourceId, const std::string& key ) = 0;
    virtual MediaPtr media( int64_t mediaId ) const = 0;
    virtual std::vector<MediaPtr> mediaForSource( int64_t sourceId ) const = 0;
    virtual bool deleteMedia( int64_t mediaId ) = 0;

    virtual MediaServerPtr newMediaServer( IMediaServer::Type type,
                                           const std::string& host,
                                           uint16_t port ) = 0;
    virtual std::vector<MediaServerPtr> mediaServers() const = 0;
    virtual bool deleteMediaServer( int64_t serverId ) = 0;

    /**
     * @brief reconcileSourceMedia Runs the media rules against every media
     * owned by the given source.
     *
     * This is the body of the "save all media for source" job.
     */
    virtual bool reconcileSourceMedia( int64_t sourceId ) = 0;

    virtual ITaskRegistry* taskRegistry() = 0;
    /**
     * @brief nextTask Fetches the next task to run in the given queue and
     * flags it as running.
     * @return The task, or nullptr if nothing is ready to run
     */
    virtual TaskPtr nextTask( const std::string& queue ) = 0;
    virtual std::vector<TaskPtr> pendingTasks() const = 0;
    virtual bool taskCompleted( int64_t taskId ) = 0;
    /**
     * @brief taskFailed Reports a failed attempt. Once the retry budget is
     * exhausted, the task is flagged as permanently failed and the failure
     * is escalated to its target.
     */
    virtual bool taskFailed( int64_t taskId, const std::string& error ) = 0;

    virtual uint32_t maxTaskAttempts() const = 0;
    virtual bool setMaxTaskAttempts( uint32_t nbAttempts ) = 0;
    virtual uint32_t retryBaseDelay() const = 0;
    virtual bool setRetryBaseDelay( uint32_t delay ) = 0;
    /**
     * @brief escalatesFailures Returns true if a permanent failure of the
     * given media task kind flags the media as skipped.
     *
     * Metadata fetching failures are always escalated.
     */
    virtual bool escalatesFailures( ITask::Kind kind ) const = 0;
    virtual bool setEscalateFailures( ITask::Kind kind, bool escalate ) = 0;
};

}

extern "C"
{
    mediasync::IMediaSync* NewMediaSync();
}
