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
#include "reconciler/FailureRules.h"
#include "reconciler/MediaRules.h"
#include "reconciler/SourceRules.h"
#include "Types.h"

namespace mediasync
{

struct Signals;
struct TaskRequest;

namespace reconciler
{

/**
 * @brief enqueue Forwards a request to the task registry. Failures are logged.
 */
void enqueue( MediaSyncPtr ml, const TaskRequest& request );
void cancel( MediaSyncPtr ml, ITask::Kind kind, int64_t targetId,
             const std::string& extra = {} );

}

/**
 * @brief The Reconciler class binds the lifecycle rules to the entity signals
 *
 * Only the events the rules react to are connected: MediaServer events are
 * left alone. The handlers capture this instance, which therefore must outlive
 * the signals.
 */
class Reconciler
{
public:
    Reconciler( MediaSyncPtr ml, Signals& signals );

    Reconciler( const Reconciler& ) = delete;
    Reconciler& operator=( const Reconciler& ) = delete;

private:
    reconciler::SourceRules m_sourceRules;
    reconciler::MediaRules m_mediaRules;
    reconciler::FailureRules m_failureRules;
};

}
