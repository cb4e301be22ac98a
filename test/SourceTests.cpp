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

#include "database/SqliteErrors.h"

class Sources : public Tests
{
};

TEST_F( Sources, Create )
{
    auto s = ms->newSource( ISource::Type::Channel, "UCxyz", "Some channel",
                            "/downloads/some_channel" );
    ASSERT_NE( nullptr, s );
    ASSERT_EQ( 0, s->id() );
    ASSERT_TRUE( s->save() );
    ASSERT_NE( 0, s->id() );

    auto s2 = ms->source( s->id() );
    ASSERT_NE( nullptr, s2 );
    ASSERT_EQ( "UCxyz", s2->key() );
    ASSERT_EQ( "Some channel", s2->name() );
    ASSERT_EQ( "/downloads/some_channel", s2->directory() );
    ASSERT_EQ( 0u, s2->indexSchedule() );
    ASSERT_TRUE( s2->downloadMedia() );
    ASSERT_FALSE( s2->copyChannelImages() );
    ASSERT_FALSE( s2->deleteFilesOnDisk() );
    ASSERT_FALSE( s2->hasFailed() );
    ASSERT_EQ( ISource::Resolution::P1080, s2->resolution() );
    ASSERT_EQ( ISource::Fallback::NextBestHd, s2->fallback() );
}

TEST_F( Sources, Duplicate )
{
    auto s = ms->addSource( "UCxyz" );
    ASSERT_NE( nullptr, s );
    auto s2 = ms->newSource( ISource::Type::Channel, "UCxyz", "dup", "/tmp" );
    ASSERT_THROW( s2->save(), sqlite::errors::ConstraintUnique );
    ASSERT_EQ( 0, s2->id() );
    ASSERT_EQ( 1u, ms->sources().size() );
}

TEST_F( Sources, SettersArePersisted )
{
    auto s = ms->addSource( "UCxyz" );
    s->setName( "Renamed" );
    s->setFilterText( "^Live", true );
    s->setDownloadCap( 86400 * 7 );
    s->setDurationLimits( 60, 3600 );
    s->setFormatPreferences( ISource::Resolution::P720, ISource::VideoCodec::AVC1,
                             ISource::AudioCodec::MP4A, false,
                             ISource::Fallback::Fail );
    ASSERT_TRUE( s->save() );

    Reload();

    auto s2 = ms->source( s->id() );
    ASSERT_EQ( "Renamed", s2->name() );
    ASSERT_EQ( "^Live", s2->filterText() );
    ASSERT_TRUE( s2->filterTextInvert() );
    ASSERT_EQ( 86400u * 7, s2->downloadCap() );
    ASSERT_EQ( 60u, s2->minDuration() );
    ASSERT_EQ( 3600u, s2->maxDuration() );
    ASSERT_EQ( ISource::Resolution::P720, s2->resolution() );
    ASSERT_EQ( ISource::VideoCodec::AVC1, s2->videoCodec() );
    ASSERT_EQ( ISource::AudioCodec::MP4A, s2->audioCodec() );
    ASSERT_FALSE( s2->prefer60fps() );
    ASSERT_EQ( ISource::Fallback::Fail, s2->fallback() );
}

TEST_F( Sources, CreateWithoutSchedule )
{
    auto s = ms->addSource( "UCxyz" );
    ASSERT_NE( nullptr, s );

    auto tasks = ms->pending();
    ASSERT_EQ( 2u, tasks.size() );
    auto check = ms->pendingTask( ITask::Kind::CheckSourceDirectory, s->id() );
    ASSERT_NE( nullptr, check );
    ASSERT_EQ( priority::Bookkeeping, check->priority() );
    ASSERT_EQ( "", check->queue() );
    ASSERT_EQ( 0u, check->repeatInterval() );
    ASSERT_EQ( "Check download directory exists for source \"UCxyz\"",
               check->verboseName() );
    auto reconcile = ms->pendingTask( ITask::Kind::SaveAllMediaForSource, s->id() );
    ASSERT_NE( nullptr, reconcile );
    ASSERT_EQ( priority::Bookkeeping, reconcile->priority() );

    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource ) );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::DownloadSourceImages ) );
}

TEST_F( Sources, CreateWithSchedule )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    ASSERT_NE( nullptr, s );

    auto index = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    ASSERT_NE( nullptr, index );
    ASSERT_EQ( 3600u, index->repeatInterval() );
    ASSERT_EQ( priority::Index, index->priority() );
    ASSERT_EQ( std::to_string( s->id() ), index->queue() );
    ASSERT_EQ( "Index media from source \"UCxyz\"", index->verboseName() );
    ASSERT_EQ( 3u, ms->pending().size() );
}

TEST_F( Sources, CreateCopiesChannelImages )
{
    auto s = ms->newSource( ISource::Type::Channel, "UCxyz", "chan", "/tmp/chan" );
    s->setCopyChannelImages( true );
    ASSERT_TRUE( s->save() );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::DownloadSourceImages, s->id() ) );

    // Playlists have no channel images
    auto p = ms->newSource( ISource::Type::Playlist, "PLxyz", "playlist", "/tmp/pl" );
    p->setCopyChannelImages( true );
    ASSERT_TRUE( p->save() );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::DownloadSourceImages, p->id() ) );
}

TEST_F( Sources, ScheduleUpdated )
{
    auto s = ms->addSource( "UCxyz" );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource ) );

    s->setIndexSchedule( 3600 );
    ASSERT_TRUE( s->save() );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::IndexSource ) );
    auto index = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    ASSERT_EQ( 3600u, index->repeatInterval() );
    ASSERT_EQ( std::to_string( s->id() ), index->queue() );

    s->setIndexSchedule( 86400 );
    ASSERT_TRUE( s->save() );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::IndexSource ) );
    auto index2 = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    ASSERT_EQ( 86400u, index2->repeatInterval() );
    ASSERT_NE( index->id(), index2->id() );
}

TEST_F( Sources, ScheduleDisabled )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::IndexSource ) );
    s->setIndexSchedule( 0 );
    ASSERT_TRUE( s->save() );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource ) );
}

TEST_F( Sources, ScheduleDisabledWhileIndexing )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    const auto now = time( nullptr );
    auto index = ms->nextTask( s->queue(), now );
    ASSERT_NE( nullptr, index );
    ASSERT_EQ( ITask::Kind::IndexSource, index->kind() );

    s->setIndexSchedule( 0 );
    ASSERT_TRUE( s->save() );
    ASSERT_TRUE( ms->completeTask( index->id(), now ) );

    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource ) );
    ASSERT_EQ( nullptr, ms->task( index->id() ) );
}

TEST_F( Sources, ScheduleUpdatedWhileIndexing )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    const auto now = time( nullptr );
    auto index = ms->nextTask( s->queue(), now );
    ASSERT_NE( nullptr, index );

    s->setIndexSchedule( 600 );
    ASSERT_TRUE( s->save() );
    ASSERT_TRUE( ms->completeTask( index->id(), now ) );

    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::IndexSource ) );
    auto t = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    ASSERT_NE( nullptr, t );
    ASSERT_EQ( 600u, t->repeatInterval() );
}

TEST_F( Sources, UnrelatedUpdateKeepsIndexTask )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    auto index = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    s->setName( "new name" );
    ASSERT_TRUE( s->save() );
    auto index2 = ms->pendingTask( ITask::Kind::IndexSource, s->id() );
    ASSERT_NE( nullptr, index2 );
    ASSERT_EQ( index->id(), index2->id() );
}

TEST_F( Sources, SaveReconcilesMedia )
{
    auto s = ms->addSource( "UCxyz" );
    auto reconcile = ms->nextTask( "", time( nullptr ) );
    ASSERT_NE( nullptr, reconcile );
    // The directory check was enqueued first, with the same priority
    ASSERT_EQ( ITask::Kind::CheckSourceDirectory, reconcile->kind() );
    ASSERT_TRUE( ms->completeTask( reconcile->id(), time( nullptr ) ) );
    reconcile = ms->nextTask( "", time( nullptr ) );
    ASSERT_EQ( ITask::Kind::SaveAllMediaForSource, reconcile->kind() );
    ASSERT_TRUE( ms->completeTask( reconcile->id(), time( nullptr ) ) );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::SaveAllMediaForSource ) );

    // Any later save schedules a single reconciliation
    s->setDownloadCap( 3600 );
    ASSERT_TRUE( s->save() );
    s->setDownloadCap( 7200 );
    ASSERT_TRUE( s->save() );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::SaveAllMediaForSource, s->id() ) );
}

TEST_F( Sources, ReconcileSourceMedia )
{
    auto s = ms->addSource( "UCxyz" );
    auto m = ms->addMedia( *s, "media1" );
    m->setMetadata( descriptor( "title" ) );
    ASSERT_TRUE( m->save() );
    ASSERT_FALSE( m->isSkipped() );

    filter->skippedKeys.insert( "media1" );
    ASSERT_TRUE( ms->reconcileSourceMedia( s->id() ) );
    m = ms->media( m->id() );
    ASSERT_TRUE( m->isSkipped() );

    ASSERT_FALSE( ms->reconcileSourceMedia( 1234 ) );
}

TEST_F( Sources, Delete )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    auto m1 = ms->addMedia( *s, "media1" );
    auto m2 = ms->addMedia( *s, "media2" );
    auto s2 = ms->addSource( "UCabc", 3600 );
    auto m3 = ms->addMedia( *s2, "media3" );

    ASSERT_TRUE( ms->deleteSource( s->id() ) );
    ASSERT_EQ( nullptr, ms->source( s->id() ) );
    ASSERT_EQ( nullptr, ms->media( m1->id() ) );
    ASSERT_EQ( nullptr, ms->media( m2->id() ) );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource, s->id() ) );

    ASSERT_NE( nullptr, ms->media( m3->id() ) );
    ASSERT_EQ( 1u, ms->countPending( ITask::Kind::IndexSource, s2->id() ) );

    ASSERT_FALSE( ms->deleteSource( s->id() ) );
}

TEST_F( Sources, DeleteWhileIndexing )
{
    auto s = ms->addSource( "UCxyz", 3600 );
    const auto now = time( nullptr );
    auto index = ms->nextTask( s->queue(), now );
    ASSERT_NE( nullptr, index );

    ASSERT_TRUE( ms->deleteSource( s->id() ) );
    ASSERT_TRUE( ms->completeTask( index->id(), now ) );

    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource, s->id() ) );
    ASSERT_EQ( nullptr, ms->task( index->id() ) );
}

TEST_F( Sources, UpdateRemovedSource )
{
    auto s = ms->addSource( "UCxyz" );
    auto s2 = ms->source( s->id() );
    ASSERT_TRUE( ms->deleteSource( s->id() ) );
    s2->setIndexSchedule( 3600 );
    ASSERT_FALSE( s2->save() );
    ASSERT_EQ( 0u, ms->countPending( ITask::Kind::IndexSource ) );
}
