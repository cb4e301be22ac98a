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

#include "Task.h"
#include "Settings.h"

namespace mediasync
{

const std::string Task::Table::Name = "Task";
const std::string Task::Table::PrimaryKeyColumn = "id_task";
int64_t Task::* const Task::Table::PrimaryKey = &Task::m_id;

Task::Task( MediaSyncPtr ml, sqlite::Row& row )
    : m_ml( ml )
    , m_id( row.extract<decltype(m_id)>() )
    , m_kind( row.extract<decltype(m_kind)>() )
    , m_targetId( row.extract<decltype(m_targetId)>() )
    , m_extra( row.extract<decltype(m_extra)>() )
    , m_queue( row.extract<decltype(m_queue)>() )
    , m_priority( row.extract<decltype(m_priority)>() )
    , m_repeatInterval( row.extract<decltype(m_repeatInterval)>() )
    , m_runAt( row.extract<decltype(m_runAt)>() )
    , m_attempts( row.extract<decltype(m_attempts)>() )
    , m_state( row.extract<decltype(m_state)>() )
    , m_verboseName( row.extract<decltype(m_verboseName)>() )
    , m_lastError( row.extract<decltype(m_lastError)>() )
    , m_cancelled( row.extract<decltype(m_cancelled)>() )
{
    assert( row.hasRemainingColumns() == false );
}

Task::Task( MediaSyncPtr ml, const TaskRequest& request, int64_t runAt )
    : m_ml( ml )
    , m_id( 0 )
    , m_kind( request.kind )
    , m_targetId( request.targetId )
    , m_extra( request.extra )
    , m_queue( request.queue )
    , m_priority( request.priority )
    , m_repeatInterval( request.repeatInterval )
    , m_runAt( runAt )
    , m_attempts( 0 )
    , m_state( State::Pending )
    , m_verboseName( request.verboseName )
    , m_cancelled( false )
{
}

int64_t Task::id() const
{
    return m_id;
}

ITask::Kind Task::kind() const
{
    return m_kind;
}

int64_t Task::targetId() const
{
    return m_targetId;
}

const std::string& Task::extra() const
{
    return m_extra;
}

const std::string& Task::queue() const
{
    return m_queue;
}

int32_t Task::priority() const
{
    return m_priority;
}

uint32_t Task::repeatInterval() const
{
    return m_repeatInterval;
}

int64_t Task::runAt() const
{
    return m_runAt;
}

uint32_t Task::attempts() const
{
    return m_attempts;
}

ITask::State Task::state() const
{
    return m_state;
}

const std::string& Task::verboseName() const
{
    return m_verboseName;
}

const std::string& Task::lastError() const
{
    return m_lastError;
}

bool Task::isCancelled() const
{
    return m_cancelled;
}

bool Task::markRunning()
{
    static const std::string req = "UPDATE " + Table::Name + " SET state = ? "
            "WHERE id_task = ?";
    if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, State::Running,
                                       m_id ) == false )
        return false;
    m_state = State::Running;
    return true;
}

bool Task::reschedule( int64_t runAt, uint32_t attempts, std::string lastError )
{
    static const std::string req = "UPDATE " + Table::Name + " SET state = ?, "
            "run_at = ?, attempts = ?, last_error = ? WHERE id_task = ?";
    if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, State::Pending,
                                       runAt, attempts, lastError, m_id ) == false )
        return false;
    m_state = State::Pending;
    m_runAt = runAt;
    m_attempts = attempts;
    m_lastError = std::move( lastError );
    return true;
}

bool Task::markFailed( uint32_t attempts, std::string lastError )
{
    static const std::string req = "UPDATE " + Table::Name + " SET state = ?, "
            "attempts = ?, last_error = ? WHERE id_task = ?";
    if ( sqlite::Tools::executeUpdate( m_ml->getConn(), req, State::Failed,
                                       attempts, lastError, m_id ) == false )
        return false;
    m_state = State::Failed;
    m_attempts = attempts;
    m_lastError = std::move( lastError );
    return true;
}

std::shared_ptr<Task> Task::create( MediaSyncPtr ml, const TaskRequest& request,
                                    int64_t runAt )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(kind, target_id, extra, queue, priority, repeat_interval, run_at,"
            "verbose_name) VALUES(?, ?, ?, ?, ?, ?, ?, ?)";
    auto task = std::make_shared<Task>( ml, request, runAt );
    if ( insert( ml, *task, req, request.kind, request.targetId, request.extra,
                 request.queue, request.priority, request.repeatInterval, runAt,
                 request.verboseName ) == false )
        return nullptr;
    return task;
}

std::shared_ptr<Task> Task::fetchPending( MediaSyncPtr ml, Kind kind,
                                          int64_t targetId, const std::string& extra )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE kind = ? AND target_id = ? AND extra = ? AND state = ?";
    return fetch( ml, req, kind, targetId, extra, State::Pending );
}

bool Task::removePending( MediaSyncPtr ml, Kind kind, int64_t targetId,
                          const std::string& extra )
{
    static const std::string req = "DELETE FROM " + Table::Name +
            " WHERE kind = ? AND target_id = ? AND extra = ? AND state = ?";
    return sqlite::Tools::executeDelete( ml->getConn(), req, kind, targetId,
                                         extra, State::Pending );
}

bool Task::cancelRunning( MediaSyncPtr ml, Kind kind, int64_t targetId,
                          const std::string& extra )
{
    static const std::string req = "UPDATE " + Table::Name + " SET cancelled = 1"
            " WHERE kind = ? AND target_id = ? AND extra = ? AND state = ?";
    return sqlite::Tools::executeUpdate( ml->getConn(), req, kind, targetId,
                                         extra, State::Running );
}

std::shared_ptr<Task> Task::fetchNext( MediaSyncPtr ml, const std::string& queue,
                                       int64_t now )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE queue = ? AND state = ? AND run_at <= ?"
            " ORDER BY priority, id_task LIMIT 1";
    return fetch( ml, req, queue, State::Pending, now );
}

std::vector<std::shared_ptr<Task>> Task::listPending( MediaSyncPtr ml )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE state = ? ORDER BY queue, priority, id_task";
    return fetchAll<Task>( ml, req, State::Pending );
}

void Task::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   schema( Table::Name, Settings::DbModelVersion ) );
}

void Task::createIndexes( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
                                   index( Indexes::PendingKey, Settings::DbModelVersion ) );
    sqlite::Tools::executeRequest( dbConnection,
                                   index( Indexes::Dispatch, Settings::DbModelVersion ) );
}

std::string Task::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    return "CREATE TABLE " + Table::Name +
    "("
        "id_task INTEGER PRIMARY KEY AUTOINCREMENT,"
        "kind UNSIGNED INTEGER NOT NULL,"
        "target_id INTEGER NOT NULL,"
        "extra TEXT NOT NULL DEFAULT '',"
        "queue TEXT NOT NULL DEFAULT '',"
        "priority INTEGER NOT NULL,"
        "repeat_interval UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "run_at INTEGER NOT NULL,"
        "attempts UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "state UNSIGNED INTEGER NOT NULL DEFAULT 0,"
        "verbose_name TEXT NOT NULL DEFAULT '',"
        "last_error TEXT NOT NULL DEFAULT '',"
        "cancelled BOOLEAN NOT NULL DEFAULT 0"
    ")";
}

std::string Task::index( Indexes index, uint32_t dbModel )
{
    switch ( index )
    {
        case Indexes::PendingKey:
            return "CREATE UNIQUE INDEX " + indexName( index, dbModel ) +
                    " ON " + Table::Name + "(kind, target_id, extra)"
                    " WHERE state = " +
                    std::to_string( static_cast<int>( State::Pending ) );
        case Indexes::Dispatch:
            return "CREATE INDEX " + indexName( index, dbModel ) +
                    " ON " + Table::Name + "(queue, state, priority, id_task)";
        default:
            assert( !"Invalid index provided" );
    }
    return "<invalid request>";
}

std::string Task::indexName( Indexes index, uint32_t )
{
    switch ( index )
    {
        case Indexes::PendingKey:
            return "task_pending_key_idx";
        case Indexes::Dispatch:
            return "task_dispatch_idx";
        default:
            assert( !"Invalid index provided" );
    }
    return "<invalid request>";
}

bool Task::checkDbModel( MediaSyncPtr ml )
{
    return sqlite::Tools::checkTableSchema( ml->getConn(),
                                            schema( Table::Name, Settings::DbModelVersion ),
                                            Table::Name );
}

}
