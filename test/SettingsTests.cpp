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

#include "Settings.h"
#include "database/SqliteTools.h"

class SettingsTests : public Tests
{
};

TEST_F( SettingsTests, Defaults )
{
    ASSERT_EQ( Settings::DbModelVersion, ms->settings().dbModelVersion() );
    ASSERT_EQ( Settings::MaxTaskAttempts, ms->maxTaskAttempts() );
    ASSERT_EQ( Settings::RetryBaseDelay, ms->retryBaseDelay() );
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::DownloadMediaThumbnail ) );
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::DownloadMedia ) );
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::IndexSource ) );
}

TEST_F( SettingsTests, Persistence )
{
    ASSERT_TRUE( ms->setMaxTaskAttempts( 5 ) );
    ASSERT_TRUE( ms->setRetryBaseDelay( 30 ) );
    ASSERT_TRUE( ms->setEscalateFailures( ITask::Kind::DownloadMediaThumbnail, true ) );
    ASSERT_TRUE( ms->setEscalateFailures( ITask::Kind::DownloadMedia, true ) );

    Reload();

    ASSERT_EQ( 5u, ms->maxTaskAttempts() );
    ASSERT_EQ( 30u, ms->retryBaseDelay() );
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMediaThumbnail ) );
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMedia ) );

    ASSERT_TRUE( ms->setEscalateFailures( ITask::Kind::DownloadMedia, false ) );
    Reload();
    ASSERT_FALSE( ms->escalatesFailures( ITask::Kind::DownloadMedia ) );
    ASSERT_TRUE( ms->escalatesFailures( ITask::Kind::DownloadMediaThumbnail ) );
}

TEST_F( SettingsTests, InvalidAttempts )
{
    ASSERT_FALSE( ms->setMaxTaskAttempts( 0 ) );
    ASSERT_EQ( Settings::MaxTaskAttempts, ms->maxTaskAttempts() );
}

TEST_F( SettingsTests, AlreadyInitialized )
{
    ASSERT_EQ( InitializeResult::AlreadyInitialized, ms->initialize( "test.db", nullptr ) );
}

TEST_F( SettingsTests, UnsupportedModel )
{
    ASSERT_TRUE( sqlite::Tools::executeUpdate( ms->getConn(),
                    "UPDATE Settings SET db_model_version = ?", 999u ) );
    ms.reset( new MediaSyncTester );
    ASSERT_EQ( InitializeResult::Failed, ms->initialize( "test.db", nullptr ) );
}
