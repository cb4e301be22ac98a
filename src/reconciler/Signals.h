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

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mediasync
{

class Source;
class Media;
class MediaServer;
class Task;

enum class LifecycleEvent : uint8_t
{
    BeforeCreate,
    AfterCreate,
    BeforeUpdate,
    AfterUpdate,
    BeforeDelete,
    AfterDelete,
};

/**
 * @brief The EntitySignal class dispatches the lifecycle events of one entity
 * type to the handlers connected for that specific event.
 *
 * Handlers receive the entity being mutated and, for BeforeUpdate, the state
 * currently persisted (nullptr if it couldn't be found).
 * Handlers are connected once during initialization and never removed, so
 * emitting doesn't need to lock.
 */
template <typename T>
class EntitySignal
{
public:
    using Handler = std::function<void( T& entity, const T* previous )>;

    void connect( LifecycleEvent event, Handler handler )
    {
        m_handlers[static_cast<size_t>( event )].push_back( std::move( handler ) );
    }

    void emit( LifecycleEvent event, T& entity, const T* previous = nullptr ) const
    {
        for ( const auto& h : m_handlers[static_cast<size_t>( event )] )
            h( entity, previous );
    }

    bool isConnected( LifecycleEvent event ) const
    {
        return m_handlers[static_cast<size_t>( event )].empty() == false;
    }

private:
    std::array<std::vector<Handler>, 6> m_handlers;
};

class TaskFailedSignal
{
public:
    using Handler = std::function<void( const Task& task )>;

    void connect( Handler handler )
    {
        m_handlers.push_back( std::move( handler ) );
    }

    void emit( const Task& task ) const
    {
        for ( const auto& h : m_handlers )
            h( task );
    }

private:
    std::vector<Handler> m_handlers;
};

struct Signals
{
    EntitySignal<Source> source;
    EntitySignal<Media> media;
    EntitySignal<MediaServer> mediaServer;
    TaskFailedSignal taskFailed;
};

}
