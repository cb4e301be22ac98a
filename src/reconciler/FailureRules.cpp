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

#include "FailureRules.h"

#include "Media.h"
#include "MediaSync.h"
#include "Settings.h"
#include "Source.h"
#include "tasks/Task.h"
#include "tasks/TaskTarget.h"

namespace mediasync
{

namespace reconciler
{

FailureRules::FailureRules( MediaSyncPtr ml )
    : m_ml( ml )
{
}

void FailureRules::onTaskFailed( const Task& task )
{
    auto target = TaskTarget::resolve( m_ml, task );
    switch ( target.type )
    {
        case TaskTarget::Type::Source:
        {
            LOG_ERROR( "Permanent failure for source ", target.source->name(),
                       ", task \"", task.verboseName(), '"' );
            target.source->setHasFailed( true );
            if ( target.source->save() == false )
                LOG_ERROR( "Failed to flag source #", target.source->id(), " as failed" );
            break;
        }
        case TaskTarget::Type::Media:
        {
            const auto& settings = m_ml->settings();
            auto& media = *target.media;
            switch ( task.kind() )
            {
                case ITask::Kind::DownloadMediaMetadata:
                    media.setSkipped( true );
                    break;
                case ITask::Kind::DownloadMediaThumbnail:
                    if ( settings.escalateThumbnailFailures() == false )
                        return;
                    // The filter would clear an automatic skip on the next save
                    media.setManuallySkipped( true );
                    media.setSkipped( true );
                    break;
                case ITask::Kind::DownloadMedia:
                    if ( settings.escalateDownloadFailures() == false )
                        return;
                    media.setManuallySkipped( true );
                    media.setSkipped( true );
                    break;
                default:
                    return;
            }
            LOG_ERROR( "Permanent failure for media ", media.title(), ", task \"",
                       task.verboseName(), "\". Skipping it" );
            if ( media.save() == false )
                LOG_ERROR( "Failed to flag media #", media.id(), " as skipped" );
            break;
        }
        case TaskTarget::Type::MediaServer:
        case TaskTarget::Type::Unknown:
            LOG_DEBUG( "Not escalating failure of task \"", task.verboseName(), '"' );
            break;
    }
}

}

}
