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

#include <memory>
#include <vector>

#include "mediasync/ITaskRegistry.h"
#include "Types.h"

namespace mediasync
{

class Task;

/**
 * @brief The TaskRegistry class stores the background tasks in the database
 *
 * Besides the keyed operations the lifecycle rules use, it provides the
 * dispatch side: fetching the next task of a queue and recording its outcome.
 * Each operation runs in its own transaction, or joins the one in progress.
 */
class TaskRegistry : public ITaskRegistry
{
public:
    explicit TaskRegistry( MediaSyncPtr ml );

    virtual bool enqueue( const TaskRequest& request ) override;
    virtual bool cancel( ITask::Kind kind, int64_t targetId,
                         const std::string& extra = {} ) override;
    virtual bool existsPending( ITask::Kind kind, int64_t targetId,
                                const std::string& extra = {} ) const override;

    /**
     * @brief next Returns the next task to run in the given queue and marks it
     * as running, or nullptr if no task is eligible at this time.
     */
    std::shared_ptr<Task> next( const std::string& queue, int64_t now );
    bool complete( int64_t taskId, int64_t now );
    /**
     * @brief fail Records a failed attempt
     *
     * The task is retried after a delay growing with its number of attempts,
     * until it runs out of attempts. It is then flagged as failed, and the
     * permanent failure signal is emitted.
     */
    bool fail( int64_t taskId, const std::string& error, int64_t now );
    std::vector<std::shared_ptr<Task>> pending() const;

    static int64_t retryDelay( uint32_t baseDelay, uint32_t attempts );

private:
    MediaSyncPtr m_ml;
};

}
