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

#include "Tests.h"

#include "tasks/TaskRegistry.h"

class Failures : public Tests
{
protected:
    std::shared_ptr<Source> s;
    int64_t now;

    virtual void SetUp() override
    {
        Tests::SetUp();
        s = ms->addSource( "UCxyz" );
        ASSERT_NE( nullptr, s );
        now = time( nullptr );
        // Get rid of the source bookkeeping
        while ( auto t = ms->nextTask( "", now ) )
            ASSERT_TRUE( ms->completeTask( t->id(), now ) );
    }

    /*
     * Dispatches the pending task matching the provided kind & target, and
     * fails it until it runs out of attempts.
     */
    void failPermanently( ITask::Kind kind, int64_t targetId, const std::string& extra = {} )
    {
        auto pending = ms->pendingTask( kind, targetId, extra );
        ASSERT_NE( nullptr, pending );
        for ( auto i = 0u; i < ms->maxTaskAttempts(); ++i )
        {
            now += 3600;
            std::shared_ptr<Task> t;
            do
            {
                t = ms->nextTask( pending->queue(), now );
                ASSERT_NE( nullptr, t );
                if ( t->id() != pending->id() )
                    ASSERT_TRUE( ms->completeTask( t->id(), now ) );
            } while ( t->id() != pending->id() );
            ASSERT_TRUE( ms->failTask( t->id(), "failure", now ) );
        }
        auto t = ms->task( pending->id() );
        ASSERT_NE( nullptr, t );
        ASSERT_EQ( ITask::State::Failed, t->state() );
    }
};

TEST_F( Failures, Retry )
{
    auto m = ms->addMedia( *s, "media1" );
    now = time( nullptr );
    auto t = ms->nextTask( "", now );
    ASSERT_NE( nullptr, t );
    ASSERT_EQ( ITask::Kind::DownloadMediaMetadata, t->kind() );
    ASSERT_TRUE( ms->failTask( t->id(), "HTTP Error 429", now ) );

    auto t2 = ms->pendingTask( ITask::Kind::DownloadMediaMetadata, m->id() );
    ASSERT_NE( nullptr, t2 );
    ASSERT_EQ( t->id(), t2->id() );
    ASSERT_EQ( 1u, t2->attempts() );
    ASSERT_EQ( "HTTP Error 429", t2->lastError() );
    ASSERT_EQ( now + TaskRegistry::retryDelay( ms->retryBaseDelay(), 1 ), t2->runAt() );
    // Not escalated yet
    ASSERT_FALSE( ms->media( m->id() )->isSkipped() );

    // The task can't run before its retry delay
    ASSERT_EQ( nullptr, ms->nextTask( "", now ) );
    ASSERT_NE( nullptr, ms->nextTask( "", t2->runAt() ) );
}

TEST_F( Failures, SourceIndexing )
{
    s->setIndexSchedule( 3600 );
    ASSERT_TRUE( s->save() );
    failPermanently( ITask::Kind::IndexSource, s->id() );
    auto s2 = ms->source( s->id() );
    ASSERT_TRUE( s2->hasFailed() );

    Reload();
    ASSERT_TRUE( ms->source( s->id() )->hasFailed() );
}

TEST_F( Failures, MetadataFetch )
{
    auto m = ms->addMedia( *s, "media1" );
    failPermanently( ITask::Kind::DownloadMediaMetadata, m->id() );

    auto m2 = ms->media( m->id() );
    ASSERT_TRUE( m2->isSkipped() );
    // This isn't a user decision
    ASSERT_FALSE( m2->isManuallySkipped() );
    ASSERT_FALSE( ms->source( s->id() )->hasFailed() );

    // Saving the media again doesn't retry fetching its metadata
    ASSERT_TRUE( m2->save() );
    ASSERT_TRUE( ms->media( m->id() )->save() );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::DownloadMediaMetadata ) );
}

TEST_F( Failures, ThumbnailNotEscalated )
{
    const std::string url = "https://i.ytimg.com/vi/media1/hq.jpg";
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::DownloadMediaThumbnail ) );
    auto m = ms->addMedia( *s, "media1" );
    m->setMetadata( descriptor( "title", url ) );
    ASSERT_TRUE( m->save() );
    ASSERT_TRUE( ms->taskRegistry()->cancel( ITask::Kind::DownloadMedia, m->id() ) );

    failPermanently( ITask::Kind::DownloadMediaThumbnail, m->id(), url );
    auto m2 = ms->media( m->id() );
    ASSERT_FALSE( m2->isSkipped() );
    ASSERT_FALSE( m2->isManuallySkipped() );
    ASSERT_FALSE( ms->source( s->id() )->hasFailed() );
}

TEST_F( Failures, DownloadNotEscalated )
{
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::DownloadMedia ) );
    auto m = ms->addMedia( *s, "media1" );
    m->setMetadata( descriptor( "title" ) );
    ASSERT_TRUE( m->save() );

    failPermanently( ITask::Kind::DownloadMedia, m->id() );
    auto m2 = ms->media( m->id() );
    ASSERT_FALSE( m2->isSkipped() );
    ASSERT_FALSE( m2->isDownloaded() );
    // The next save schedules a new attempt
    ASSERT_TRUE( m2->save() );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::DownloadMedia, m->id() ) );
}

TEST_F( Failures, DownloadEscalated )
{
    ASSERT_TRUE( ms->setEscalateFailures( ITask::Kind::DownloadMedia, true ) );
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMedia ) );
    auto m = ms->addMedia( *s, "media1" );
    m->setMetadata( descriptor( "title" ) );
    ASSERT_TRUE( m->save() );

    failPermanently( ITask::Kind::DownloadMedia, m->id() );
    auto m2 = ms->media( m->id() );
    ASSERT_TRUE( m2->isSkipped() );
    ASSERT_TRUE( m2->isManuallySkipped() );

    // The filter doesn't revert the skip
    ASSERT_TRUE( m2->save() );
    ASSERT_TRUE( ms->media( m->id() )->isSkipped() );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::DownloadMedia ) );
}

TEST_F( Failures, ThumbnailEscalated )
{
    const std::string url = "https://i.ytimg.com/vi/media1/hq.jpg";
    ASSERT_TRUE( ms->setEscalateFailures( ITask::Kind::DownloadMediaThumbnail, true ) );
    auto m = ms->addMedia( *s, "media1" );
    m->setMetadata( descriptor( "title", url ) );
    ASSERT_TRUE( m->save() );

    failPermanently( ITask::Kind::DownloadMediaThumbnail, m->id(), url );
    ASSERT_TRUE( ms->media( m->id() )->isSkipped() );
}

TEST_F( Failures, MetadataAlwaysEscalated )
{
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMediaMetadata ) );
    ASSERT_FALSE( ms->setEscalateFailures( ITask::Kind::DownloadMediaMetadata, false ) );
    ASSERT_FALSE( ms->setEscalateFailures( ITask::Kind::IndexSource, false ) );
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMediaMetadata ) );
}

TEST_F( Failures, MediaServerRescan )
{
    auto server = ms->addMediaServer( "plex.lan", 32400 );
    auto m = ms->addMedia( *s, "media1" );
    ASSERT_TRUE( ms->deleteMedia( m->id() ) );
    failPermanently( ITask::Kind::RescanMediaServer, server->id() );
    ASSERT_EQ( 1u, ms->mediaServers().size() );
    ASSERT_FALSE( ms->source( s->id() )->hasFailed() );
}

TEST_F( Failures, RemovedTarget )
{
    auto m = ms->addMedia( *s, "media1" );
    now = time( nullptr );
    auto t = ms->nextTask( "", now );
    ASSERT_NE( nullptr, t );
    ASSERT_EQ( ITask::Kind::DownloadMediaMetadata, t->kind() );
    // The metadata task outlives its media
    ASSERT_TRUE( ms->deleteMedia( m->id() ) );
    ASSERT_TRUE( ms->setMaxTaskAttempts( 1 ) );
    ASSERT_TRUE( ms->failTask( t->id(), "failure", now ) );
    ASSERT_EQ( ITask::State::Failed, ms->task( t->id() )->state() );
    ASSERT_EQ( nullptr, ms->media( m->id() ) );
}

TEST_F( Failures, FailNotRunning )
{
    auto m = ms->addMedia( *s, "media1" );
    auto t = ms->pendingTask( ITask::Kind::DownloadMediaMetadata, m->id() );
    ASSERT_FALSE( ms->failTask( t->id(), "failure", now ) );
    ASSERT_FALSE( ms->completeTask( t->id(), now ) );
    ASSERT_FALSE( ms->failTask( 1234, "failure", now ) );
}
