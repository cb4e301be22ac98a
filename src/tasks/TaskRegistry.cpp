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

#include "TaskRegistry.h"
#include "Task.h"
#include "MediaSync.h"
#include "Settings.h"
#include "reconciler/Signals.h"

#include <ctime>

namespace mediasync
{

TaskRegistry::TaskRegistry( MediaSyncPtr ml )
    : m_ml( ml )
{
}

bool TaskRegistry::enqueue( const TaskRequest& request )
{
    auto t = m_ml->getConn()->newTransaction();
    if ( request.replaceExisting == true )
    {
        if ( Task::removePending( m_ml, request.kind, request.targetId,
                                  request.extra ) == false )
            return false;
    }
    else if ( Task::fetchPending( m_ml, request.kind, request.targetId,
                                  request.extra ) != nullptr )
    {
        LOG_DEBUG( "Task \"", request.verboseName, "\" is already pending" );
        return true;
    }
    auto task = Task::create( m_ml, request, time( nullptr ) );
    if ( task == nullptr )
        return false;
    t->commit();
    LOG_DEBUG( "Enqueued task #", task->id(), " \"", task->verboseName(),
               "\" in queue \"", task->queue(), "\" with priority ", task->priority() );
    return true;
}

bool TaskRegistry::cancel( ITask::Kind kind, int64_t targetId, const std::string& extra )
{
    auto t = m_ml->getConn()->newTransaction();
    if ( Task::removePending( m_ml, kind, targetId, extra ) == false ||
         Task::cancelRunning( m_ml, kind, targetId, extra ) == false )
        return false;
    t->commit();
    return true;
}

bool TaskRegistry::existsPending( ITask::Kind kind, int64_t targetId,
                                  const std::string& extra ) const
{
    return Task::fetchPending( m_ml, kind, targetId, extra ) != nullptr;
}

std::shared_ptr<Task> TaskRegistry::next( const std::string& queue, int64_t now )
{
    auto t = m_ml->getConn()->newTransaction();
    auto task = Task::fetchNext( m_ml, queue, now );
    if ( task == nullptr )
        return nullptr;
    if ( task->markRunning() == false )
        return nullptr;
    t->commit();
    return task;
}

bool TaskRegistry::complete( int64_t taskId, int64_t now )
{
    auto t = m_ml->getConn()->newTransaction();
    auto task = Task::fetch( m_ml, taskId );
    if ( task == nullptr || task->state() != ITask::State::Running )
    {
        LOG_WARN( "Can't complete task #", taskId, ": it isn't running" );
        return false;
    }
    bool res;
    if ( task->isCancelled() == true || task->repeatInterval() == 0 ||
         Task::fetchPending( m_ml, task->kind(), task->targetId(),
                             task->extra() ) != nullptr )
    {
        res = Task::destroy( m_ml, taskId );
    }
    else
    {
        res = task->reschedule( now + task->repeatInterval(), 0, {} );
    }
    if ( res == false )
        return false;
    t->commit();
    return true;
}

bool TaskRegistry::fail( int64_t taskId, const std::string& error, int64_t now )
{
    auto t = m_ml->getConn()->newTransaction();
    auto task = Task::fetch( m_ml, taskId );
    if ( task == nullptr || task->state() != ITask::State::Running )
    {
        LOG_WARN( "Can't fail task #", taskId, ": it isn't running" );
        return false;
    }
    if ( task->isCancelled() == true )
    {
        LOG_DEBUG( "Dropping cancelled task #", taskId, " after failure: ", error );
        if ( Task::destroy( m_ml, taskId ) == false )
            return false;
        t->commit();
        return true;
    }
    const auto& settings = m_ml->settings();
    auto attempts = task->attempts() + 1;
    if ( attempts < settings.maxTaskAttempts() )
    {
        bool res;
        if ( Task::fetchPending( m_ml, task->kind(), task->targetId(),
                                 task->extra() ) != nullptr )
        {
            LOG_DEBUG( "Dropping retry of task #", taskId, ": superseded" );
            res = Task::destroy( m_ml, taskId );
        }
        else
        {
            auto runAt = now + retryDelay( settings.retryBaseDelay(), attempts );
            LOG_INFO( "Task \"", task->verboseName(), "\" failed (", error,
                      "), retrying at ", runAt );
            res = task->reschedule( runAt, attempts, error );
        }
        if ( res == false )
            return false;
    }
    else
    {
        LOG_ERROR( "Task \"", task->verboseName(), "\" permanently failed after ",
                   attempts, " attempt(s): ", error );
        if ( task->markFailed( attempts, error ) == false )
            return false;
        m_ml->signals().taskFailed.emit( *task );
    }
    t->commit();
    return true;
}

std::vector<std::shared_ptr<Task>> TaskRegistry::pending() const
{
    return Task::listPending( m_ml );
}

int64_t TaskRegistry::retryDelay( uint32_t baseDelay, uint32_t attempts )
{
    int64_t a = attempts;
    return baseDelay + a * a * a * a;
}

}
