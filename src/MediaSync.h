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

#ifndef MEDIASYNC_H
#define MEDIASYNC_H

#include "mediasync/IMediaSync.h"
#include "Settings.h"
#include "reconciler/Signals.h"

#include <memory>
#include <mutex>

namespace mediasync
{

class Reconciler;
class TaskRegistry;

namespace sqlite
{
class Connection;
}

class MediaSync : public IMediaSync
{
public:
    MediaSync();
    virtual ~MediaSync();

    virtual InitializeResult initialize( const std::string& dbPath,
                                         const SetupConfig* cfg ) override;
    virtual void setVerbosity( LogLevel v ) override;

    virtual SourcePtr newSource( ISource::Type type, const std::string& key,
                                 const std::string& name,
                                 const std::string& directory ) override;
    virtual SourcePtr source( int64_t sourceId ) const override;
    virtual std::vector<SourcePtr> sources() const override;
    virtual bool deleteSource( int64_t sourceId ) override;

    virtual MediaPtr newMedia( int64_t sourceId, const std::string& key ) override;
    virtual MediaPtr media( int64_t mediaId ) const override;
    virtual std::vector<MediaPtr> mediaForSource( int64_t sourceId ) const override;
    virtual bool deleteMedia( int64_t mediaId ) override;

    virtual MediaServerPtr newMediaServer( IMediaServer::Type type,
                                           const std::string& host,
                                           uint16_t port ) override;
    virtual std::vector<MediaServerPtr> mediaServers() const override;
    virtual bool deleteMediaServer( int64_t serverId ) override;

    virtual bool reconcileSourceMedia( int64_t sourceId ) override;

    virtual ITaskRegistry* taskRegistry() override;
    virtual TaskPtr nextTask( const std::string& queue ) override;
    virtual std::vector<TaskPtr> pendingTasks() const override;
    virtual bool taskCompleted( int64_t taskId ) override;
    virtual bool taskFailed( int64_t taskId, const std::string& error ) override;

    virtual uint32_t maxTaskAttempts() const override;
    virtual bool setMaxTaskAttempts( uint32_t nbAttempts ) override;
    virtual uint32_t retryBaseDelay() const override;
    virtual bool setRetryBaseDelay( uint32_t delay ) override;
    virtual bool escalatesFailures( ITask::Kind kind ) const override;
    virtual bool setEscalateFailures( ITask::Kind kind, bool escalate ) override;

    sqlite::Connection* getConn() const;
    const Signals& signals() const;
    const Settings& settings() const;
    TaskRegistry& registry() const;
    fs::IFileSystem& fileSystem() const;
    IFilterEngine& filterEngine() const;
    IFormatSelector& formatSelector() const;

protected:
    void createAllTables();
    bool checkDatabaseIntegrity();

protected:
    std::mutex m_mutex;
    bool m_initialized;
    std::shared_ptr<sqlite::Connection> m_dbConnection;
    Settings m_settings;
    Signals m_signals;
    std::unique_ptr<TaskRegistry> m_registry;
    std::unique_ptr<Reconciler> m_reconciler;

    std::shared_ptr<ILogger> m_logger;
    std::shared_ptr<fs::IFileSystem> m_fileSystem;
    std::shared_ptr<IFilterEngine> m_filterEngine;
    std::shared_ptr<IFormatSelector> m_formatSelector;
};

}

#endif // MEDIASYNC_H
