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

#include "TaskTarget.h"

#include "mediasync/ITask.h"
#include "Media.h"
#include "MediaServer.h"
#include "Source.h"
#include "logging/Logger.h"

namespace mediasync
{

TaskTarget TaskTarget::resolve( MediaSyncPtr ml, const ITask& task )
{
    TaskTarget target;
    switch ( task.kind() )
    {
        case ITask::Kind::IndexSource:
        case ITask::Kind::CheckSourceDirectory:
        case ITask::Kind::DownloadSourceImages:
        case ITask::Kind::SaveAllMediaForSource:
            target.source = Source::fetch( ml, task.targetId() );
            if ( target.source != nullptr )
                target.type = Type::Source;
            break;
        case ITask::Kind::DownloadMediaMetadata:
        case ITask::Kind::DownloadMediaThumbnail:
        case ITask::Kind::DownloadMedia:
            target.media = Media::fetch( ml, task.targetId() );
            if ( target.media != nullptr )
                target.type = Type::Media;
            break;
        case ITask::Kind::RescanMediaServer:
            target.mediaServer = MediaServer::fetch( ml, task.targetId() );
            if ( target.mediaServer != nullptr )
                target.type = Type::MediaServer;
            break;
        default:
            LOG_WARN( "Unknown task kind ", static_cast<int>( task.kind() ) );
            break;
    }
    return target;
}

}
