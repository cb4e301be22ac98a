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

#if HAVE_CONFIG_H
# include "config.h"
#endif

#include "MediaSyncTester.h"

#include "tasks/TaskRegistry.h"

#include <algorithm>

std::shared_ptr<Source> MediaSyncTester::source( int64_t id )
{
    return Source::fetch( this, id );
}

std::shared_ptr<Media> MediaSyncTester::media( int64_t id )
{
    return Media::fetch( this, id );
}

std::shared_ptr<Source> MediaSyncTester::addSource( const std::string& key,
                                                    uint32_t indexSchedule,
                                                    ISource::Type type )
{
    auto s = std::make_shared<Source>( this, type, key, key, "/downloads/" + key );
    s->setIndexSchedule( indexSchedule );
    if ( s->save() == false )
        return nullptr;
    return s;
}

std::shared_ptr<Media> MediaSyncTester::addMedia( const Source& source, const std::string& key )
{
    auto m = std::make_shared<Media>( this, source.id(), key );
    if ( m->save() == false )
        return nullptr;
    return m;
}

std::shared_ptr<MediaServer> MediaSyncTester::addMediaServer( const std::string& host,
                                                              uint16_t port )
{
    auto s = std::make_shared<MediaServer>( this, IMediaServer::Type::Plex, host, port );
    if ( s->save() == false )
        return nullptr;
    return s;
}

std::shared_ptr<Task> MediaSyncTester::nextTask( const std::string& queue, int64_t now )
{
    return m_registry->next( queue, now );
}

bool MediaSyncTester::completeTask( int64_t taskId, int64_t now )
{
    return m_registry->complete( taskId, now );
}

bool MediaSyncTester::failTask( int64_t taskId, const std::string& error, int64_t now )
{
    return m_registry->fail( taskId, error, now );
}

std::vector<std::shared_ptr<Task>> MediaSyncTester::pending()
{
    return m_registry->pending();
}

std::shared_ptr<Task> MediaSyncTester::pendingTask( ITask::Kind kind, int64_t targetId,
                                                    const std::string& extra )
{
    return Task::fetchPending( this, kind, targetId, extra );
}

uint32_t MediaSyncTester::countPending( ITask::Kind kind )
{
    auto tasks = pending();
    return std::count_if( begin( tasks ), end( tasks ),
                          [kind]( const std::shared_ptr<Task>& t ) {
        return t->kind() == kind;
    } );
}

uint32_t MediaSyncTester::countPending( ITask::Kind kind, int64_t targetId )
{
    auto tasks = pending();
    return std::count_if( begin( tasks ), end( tasks ),
                          [kind, targetId]( const std::shared_ptr<Task>& t ) {
        return t->kind() == kind && t->targetId() == targetId;
    } );
}

std::shared_ptr<Task> MediaSyncTester::task( int64_t taskId )
{
    return Task::fetch( this, taskId );
}

Signals& MediaSyncTester::signals()
{
    return m_signals;
}
