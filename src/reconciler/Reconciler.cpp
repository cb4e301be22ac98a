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

#include "Reconciler.h"

#include "Media.h"
#include "MediaSync.h"
#include "Source.h"
#include "reconciler/Signals.h"
#include "tasks/TaskRegistry.h"

namespace mediasync
{

namespace reconciler
{

void enqueue( MediaSyncPtr ml, const TaskRequest& request )
{
    LOG_INFO( "Scheduling task \"", request.verboseName, '"' );
    if ( ml->registry().enqueue( request ) == false )
        LOG_ERROR( "Failed to schedule task \"", request.verboseName, '"' );
}

void cancel( MediaSyncPtr ml, ITask::Kind kind, int64_t targetId,
             const std::string& extra )
{
    LOG_DEBUG( "Cancelling pending task ", static_cast<int>( kind ), " for #", targetId );
    if ( ml->registry().cancel( kind, targetId, extra ) == false )
        LOG_ERROR( "Failed to cancel task ", static_cast<int>( kind ), " for #", targetId );
}

}

Reconciler::Reconciler( MediaSyncPtr ml, Signals& signals )
    : m_sourceRules( ml )
    , m_mediaRules( ml )
    , m_failureRules( ml )
{
    auto& source = signals.source;
    source.connect( LifecycleEvent::BeforeUpdate, [this]( Source& s, const Source* previous ) {
        m_sourceRules.onBeforeUpdate( s, previous );
    });
    source.connect( LifecycleEvent::AfterCreate, [this]( Source& s, const Source* ) {
        m_sourceRules.onAfterCreate( s );
        m_sourceRules.onAfterSave( s );
    });
    source.connect( LifecycleEvent::AfterUpdate, [this]( Source& s, const Source* ) {
        m_sourceRules.onAfterSave( s );
    });
    source.connect( LifecycleEvent::BeforeDelete, [this]( Source& s, const Source* ) {
        m_sourceRules.onBeforeDelete( s );
    });
    source.connect( LifecycleEvent::AfterDelete, [this]( Source& s, const Source* ) {
        m_sourceRules.onAfterDelete( s );
    });

    auto& media = signals.media;
    auto derive = [this]( Media& m, const Media* ) {
        m_mediaRules.derive( m );
    };
    auto schedule = [this]( Media& m, const Media* ) {
        m_mediaRules.schedule( m );
    };
    media.connect( LifecycleEvent::BeforeCreate, derive );
    media.connect( LifecycleEvent::BeforeUpdate, derive );
    media.connect( LifecycleEvent::AfterCreate, schedule );
    media.connect( LifecycleEvent::AfterUpdate, schedule );
    media.connect( LifecycleEvent::BeforeDelete, [this]( Media& m, const Media* ) {
        m_mediaRules.onBeforeDelete( m );
    });
    media.connect( LifecycleEvent::AfterDelete, [this]( Media& m, const Media* ) {
        m_mediaRules.onAfterDelete( m );
    });

    signals.taskFailed.connect( [this]( const Task& t ) {
        m_failureRules.onTaskFailed( t );
    });
}

}
