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

#include "Types.h"

namespace mediasync
{

class Task;

namespace reconciler
{

/**
 * @brief The FailureRules class flags the entity targeted by a task which
 * permanently failed.
 *
 * A failed source task flags the source as failed. A failed metadata task
 * skips its media; thumbnail and media download failures only do so when
 * configured to.
 */
class FailureRules
{
public:
    explicit FailureRules( MediaSyncPtr ml );
    void onTaskFailed( const Task& task );

private:
    MediaSyncPtr m_ml;
};

}

}
