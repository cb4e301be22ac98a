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

#include "MediaRules.h"
#include "Reconciler.h"

#include "mediasync/IFilterEngine.h"
#include "mediasync/ITaskRegistry.h"
#include "mediasync/IFormatSelector.h"
#include "mediasync/filesystem/IFileSystem.h"
#include "Media.h"
#include "MediaServer.h"
#include "MediaSync.h"
#include "Source.h"
#include "tasks/TaskRegistry.h"
#include "utils/Filename.h"

namespace mediasync
{

namespace reconciler
{

MediaRules::MediaRules( MediaSyncPtr ml )
    : m_ml( ml )
{
}

void MediaRules::derive( Media& media )
{
    if ( media.isManuallySkipped() == true )
        return;
    auto source = Source::fetch( m_ml, media.sourceId() );
    if ( source == nullptr )
    {
        LOG_WARN( "Can't find source #", media.sourceId(), " of media ", media.key() );
        return;
    }
    auto skip = media.isSkipped();
    auto canDownload = media.canDownload();
    if ( media.hasMetadata() == true )
    {
        if ( media.isDownloaded() == false )
            skip = m_ml->filterEngine().shouldSkip( media, *source );
        canDownload = m_ml->formatSelector().hasValidFormat( media, *source );
    }
    const auto& fs = m_ml->fileSystem();
    auto thumbnailMissing = media.thumbnailFile().empty() == false &&
            fs.fileExists( media.thumbnailFile() ) == false;
    auto mediaFileMissing = media.mediaFile().empty() == false &&
            fs.fileExists( media.mediaFile() ) == false;

    if ( skip != media.isSkipped() )
    {
        LOG_INFO( "Media ", media.title(), skip ? " is now skipped" : " is no longer skipped" );
        media.setSkipped( skip );
    }
    if ( canDownload != media.canDownload() )
    {
        LOG_DEBUG( "Media ", media.title(), canDownload ? " can now be downloaded" :
                                                         " can't be downloaded anymore" );
        media.setCanDownload( canDownload );
    }
    if ( thumbnailMissing == true )
    {
        LOG_INFO( "Thumbnail ", media.thumbnailFile(), " of media ", media.title(),
                  " is missing" );
        media.setThumbnailFile( {} );
    }
    if ( mediaFileMissing == true )
    {
        LOG_INFO( "File ", media.mediaFile(), " of media ", media.title(), " is missing" );
        media.setDownloaded( {} );
    }
}

void MediaRules::schedule( Media& media )
{
    if ( media.isManuallySkipped() == true )
        return;
    auto source = Source::fetch( m_ml, media.sourceId() );
    if ( source == nullptr )
        return;
    if ( media.hasMetadata() == false && media.isSkipped() == false &&
         m_ml->registry().existsPending( ITask::Kind::DownloadMediaMetadata,
                                         media.id() ) == false )
    {
        enqueue( m_ml, TaskRequest{
            ITask::Kind::DownloadMediaMetadata, media.id(), {}, priority::Metadata,
            {}, 0, "Downloading metadata for \"" + std::to_string( media.id() ) + '"',
            true
        } );
    }
    if ( media.thumbnailFile().empty() == true && media.isSkipped() == false &&
         media.thumbnailUrl().empty() == false )
    {
        enqueue( m_ml, TaskRequest{
            ITask::Kind::DownloadMediaThumbnail, media.id(), media.thumbnailUrl(),
            priority::Thumbnail, source->queue(), 0,
            "Downloading thumbnail for \"" + media.title() + '"', true
        } );
    }
    if ( media.isDownloaded() == false && media.canDownload() == true &&
         media.isSkipped() == false && source->downloadMedia() == true )
    {
        cancel( m_ml, ITask::Kind::DownloadMedia, media.id() );
        enqueue( m_ml, TaskRequest{
            ITask::Kind::DownloadMedia, media.id(), {}, priority::Download,
            source->queue(), 0, "Downloading media for \"" + media.title() + '"', true
        } );
    }
}

void MediaRules::onBeforeDelete( Media& media )
{
    LOG_INFO( "Deleting tasks for media ", media.title() );
    cancel( m_ml, ITask::Kind::DownloadMedia, media.id() );
    if ( media.thumbnailUrl().empty() == false )
        cancel( m_ml, ITask::Kind::DownloadMediaThumbnail, media.id(), media.thumbnailUrl() );

    if ( media.mediaFile().empty() == true && media.thumbnailFile().empty() == true )
        return;
    auto source = Source::fetch( m_ml, media.sourceId() );
    if ( source == nullptr || source->deleteFilesOnDisk() == false )
        return;
    const auto& path = media.mediaFile().empty() == false ? media.mediaFile() :
                                                            media.thumbnailFile();
    auto& fs = m_ml->fileSystem();
    for ( const auto& file : fs.listFilesMatching( utils::file::stripExtension( path ) ) )
    {
        LOG_INFO( "Deleting file ", file, " of media ", media.title() );
        if ( fs.remove( file ) == false )
            LOG_WARN( "Failed to delete ", file );
    }
}

void MediaRules::onAfterDelete( Media& )
{
    for ( const auto& server : MediaServer::fetchAll<MediaServer>( m_ml ) )
    {
        enqueue( m_ml, TaskRequest{
            ITask::Kind::RescanMediaServer, server->id(), {}, priority::Rescan,
            {}, 0, "Request media server rescan for \"" + server->url() + '"', true
        } );
    }
}

}

}
