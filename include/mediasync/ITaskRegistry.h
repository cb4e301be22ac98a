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

#include "mediasync/ITask.h"

namespace mediasync
{

struct TaskRequest
{
    ITask::Kind kind;
    int64_t targetId;
    std::string extra;
    int32_t priority;
    std::string queue;
    uint32_t repeatInterval;
    std::string verboseName;
    /**
     * When true, any pending task with the same key is replaced. Otherwise an
     * existing pending task is kept and the request is a no-op.
     */
    bool replaceExisting;
};

/**
 * @brief The ITaskRegistry class is a keyed store of pending background jobs
 *
 * A key is a (kind, targetId, extra) tuple, and at most one pending task may
 * exist for a given key.
 */
class ITaskRegistry
{
public:
    virtual ~ITaskRegistry() = default;
    virtual bool enqueue( const TaskRequest& request ) = 0;
    /**
     * @brief cancel Removes the pending task for the given key, if any
     *
     * A task already dispatched keeps running, but it is dropped once its
     * outcome is reported: it won't be repeated nor retried.
     */
    virtual bool cancel( ITask::Kind kind, int64_t targetId,
                         const std::string& extra = {} ) = 0;
    virtual bool existsPending( ITask::Kind kind, int64_t targetId,
                                const std::string& extra = {} ) const = 0;
};

}
