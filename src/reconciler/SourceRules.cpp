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

#include "SourceRules.h"
#include "Reconciler.h"

#include "mediasync/ITaskRegistry.h"

#include "Media.h"
#include "MediaSync.h"
#include "Source.h"

namespace mediasync
{

namespace reconciler
{

SourceRules::SourceRules( MediaSyncPtr ml )
    : m_ml( ml )
{
}

void SourceRules::scheduleIndexing( const Source& source )
{
    cancel( m_ml, ITask::Kind::IndexSource, source.id() );
    if ( source.indexSchedule() == 0 )
    {
        LOG_INFO( "Indexing disabled for source ", source.name() );
        return;
    }
    enqueue( m_ml, TaskRequest{
        ITask::Kind::IndexSource, source.id(), {}, priority::Index,
        source.queue(), source.indexSchedule(),
        "Index media from source \"" + source.name() + '"', true
    } );
}

void SourceRules::onBeforeUpdate( Source& source, const Source* previous )
{
    if ( previous == nullptr )
        return;
    if ( previous->indexSchedule() == source.indexSchedule() )
        return;
    LOG_INFO( "Index schedule of source ", source.name(), " changed from ",
              previous->indexSchedule(), "s to ", source.indexSchedule(), 's' );
    scheduleIndexing( source );
}

void SourceRules::onAfterCreate( Source& source )
{
    enqueue( m_ml, TaskRequest{
        ITask::Kind::CheckSourceDirectory, source.id(), {}, priority::Bookkeeping,
        {}, 0, "Check download directory exists for source \"" + source.name() + '"',
        false
    } );
    if ( source.type() != ISource::Type::Playlist && source.copyChannelImages() == true )
    {
        enqueue( m_ml, TaskRequest{
            ITask::Kind::DownloadSourceImages, source.id(), {}, priority::Bookkeeping,
            {}, 0, "Download images for source \"" + source.name() + '"', false
        } );
    }
    if ( source.indexSchedule() > 0 )
        scheduleIndexing( source );
}

void SourceRules::onAfterSave( Source& source )
{
    enqueue( m_ml, TaskRequest{
        ITask::Kind::SaveAllMediaForSource, source.id(), {}, priority::Bookkeeping,
        {}, 0, "Checking all media for source \"" + source.name() + '"', true
    } );
}

void SourceRules::onBeforeDelete( Source& source )
{
    for ( const auto& m : source.media() )
    {
        LOG_INFO( "Deleting media ", m->title(), " of source ", source.name() );
        if ( Media::remove( m_ml, m->id() ) == false )
            LOG_WARN( "Failed to delete media #", m->id() );
    }
}

void SourceRules::onAfterDelete( Source& source )
{
    LOG_INFO( "Deleting tasks for source ", source.name() );
    cancel( m_ml, ITask::Kind::IndexSource, source.id() );
}

}

}
