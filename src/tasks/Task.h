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

#include "mediasync/ITask.h"
#include "mediasync/ITaskRegistry.h"
#include "database/DatabaseHelpers.h"

namespace mediasync
{

class Task : public ITask, public DatabaseHelpers<Task>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
        static int64_t Task::*const PrimaryKey;
    };
    enum class Indexes : uint8_t
    {
        /// Enforces a single pending task per key
        PendingKey,
        Dispatch,
    };

    Task( MediaSyncPtr ml, sqlite::Row& row );
    Task( MediaSyncPtr ml, const TaskRequest& request, int64_t runAt );

    virtual int64_t id() const override;
    virtual Kind kind() const override;
    virtual int64_t targetId() const override;
    virtual const std::string& extra() const override;
    virtual const std::string& queue() const override;
    virtual int32_t priority() const override;
    virtual uint32_t repeatInterval() const override;
    virtual int64_t runAt() const override;
    virtual uint32_t attempts() const override;
    virtual State state() const override;
    virtual const std::string& verboseName() const override;
    virtual const std::string& lastError() const override;
    /**
     * @brief isCancelled Returns true if the task was cancelled while running.
     * It will be dropped once its outcome is reported.
     */
    bool isCancelled() const;

    bool markRunning();
    /**
     * @brief reschedule Moves the task back to the pending state
     * @param runAt The time before which the task won't be dispatched
     * @param attempts The number of failed attempts so far
     * @param lastError The error reported by the last attempt, if any
     */
    bool reschedule( int64_t runAt, uint32_t attempts, std::string lastError );
    bool markFailed( uint32_t attempts, std::string lastError );

    static std::shared_ptr<Task> create( MediaSyncPtr ml, const TaskRequest& request,
                                         int64_t runAt );
    static std::shared_ptr<Task> fetchPending( MediaSyncPtr ml, Kind kind,
                                               int64_t targetId,
                                               const std::string& extra );
    static bool removePending( MediaSyncPtr ml, Kind kind, int64_t targetId,
                               const std::string& extra );
    static bool cancelRunning( MediaSyncPtr ml, Kind kind, int64_t targetId,
                               const std::string& extra );
    /**
     * @brief fetchNext Returns the first pending task eligible for dispatch in
     * the given queue: lowest priority first, then in insertion order.
     */
    static std::shared_ptr<Task> fetchNext( MediaSyncPtr ml, const std::string& queue,
                                            int64_t now );
    static std::vector<std::shared_ptr<Task>> listPending( MediaSyncPtr ml );

    static void createTable( sqlite::Connection* dbConnection );
    static void createIndexes( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static std::string index( Indexes index, uint32_t dbModel );
    static std::string indexName( Indexes index, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );

private:
    MediaSyncPtr m_ml;

    int64_t m_id;
    const Kind m_kind;
    const int64_t m_targetId;
    const std::string m_extra;
    const std::string m_queue;
    const int32_t m_priority;
    const uint32_t m_repeatInterval;
    int64_t m_runAt;
    uint32_t m_attempts;
    State m_state;
    const std::string m_verboseName;
    std::string m_lastError;
    bool m_cancelled;

    friend struct Task::Table;
};

}
