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

#include "Types.h"

namespace mediasync
{

class ITask;

/**
 * @brief The TaskTarget struct holds the entity a task was scheduled for.
 *
 * Exactly one of the pointers is set, matching the type, unless the type is
 * Unknown, in which case none is.
 */
struct TaskTarget
{
    enum class Type : uint8_t
    {
        Source,
        Media,
        MediaServer,
        /// The task kind isn't bound to an entity, or its entity is gone
        Unknown,
    };

    Type type = Type::Unknown;
    std::shared_ptr<Source> source;
    std::shared_ptr<Media> media;
    std::shared_ptr<MediaServer> mediaServer;

    static TaskTarget resolve( MediaSyncPtr ml, const ITask& task );
};

}
