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
#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"
#include "mediasync/ITaskRegistry.h"

#include <atomic>
#include <thread>
#include <vector>

class Database : public Tests
{
protected:
    static TaskRequest request( int64_t targetId )
    {
        return TaskRequest{ ITask::Kind::DownloadMedia, targetId, {},
                            priority::Download, "1", 0, "task", true };
    }
};

TEST_F( Database, Commit )
{
    auto t = ms->getConn()->newTransaction();
    ASSERT_TRUE( sqlite::Transaction::isInProgress() );
    ASSERT_TRUE( ms->taskRegistry()->enqueue( request( 1 ) ) );
    t->commit();
    ASSERT_FALSE( sqlite::Transaction::isInProgress() );
    t.reset();
    ASSERT_TRUE( ms->taskRegistry()->existsPending( ITask::Kind::DownloadMedia, 1 ) );
}

TEST_F( Database, Rollback )
{
    {
        auto t = ms->getConn()->newTransaction();
        ASSERT_TRUE( ms->taskRegistry()->enqueue( request( 1 ) ) );
        ASSERT_TRUE( ms->taskRegistry()->enqueue( request( 2 ) ) );
        // Destroyed without committing
    }
    ASSERT_FALSE( sqlite::Transaction::isInProgress() );
    ASSERT_TRUE( ms->pending().empty() );
    // The connection is usable again
    ASSERT_TRUE( ms->taskRegistry()->enqueue( request( 3 ) ) );
    ASSERT_EQ( 1u, ms->pending().size() );
}

TEST_F( Database, NestedTransaction )
{
    auto t = ms->getConn()->newTransaction();
    {
        auto nested = ms->getConn()->newTransaction();
        ASSERT_TRUE( ms->taskRegistry()->enqueue( request( 1 ) ) );
        nested->commit();
    }
    ASSERT_TRUE( sqlite::Transaction::isInProgress() );
    t.reset();
    // Committing the nested transaction doesn't commit the outer one
    ASSERT_TRUE( ms->pending().empty() );
}

TEST_F( Database, ForeignKeyViolation )
{
    static const std::string req = "INSERT INTO Media(source_id, key) VALUES(?, ?)";
    ASSERT_THROW( sqlite::Tools::executeInsert( ms->getConn(), req,
                                                sqlite::ForeignKey{ 999 }, "media1" ),
                  sqlite::errors::ConstraintForeignKey );
}

TEST_F( Database, UniqueViolation )
{
    auto s = ms->addSource( "UCxyz" );
    static const std::string req = "INSERT INTO Media(source_id, key) VALUES(?, ?)";
    ASSERT_NE( 0, sqlite::Tools::executeInsert( ms->getConn(), req,
                                                sqlite::ForeignKey{ s->id() }, "media1" ) );
    ASSERT_THROW( sqlite::Tools::executeInsert( ms->getConn(), req,
                                                sqlite::ForeignKey{ s->id() }, "media1" ),
                  sqlite::errors::ConstraintUnique );
}

TEST_F( Database, ConcurrentTransactions )
{
    const auto nbThreads = 4;
    const auto nbTasks = 50;
    std::atomic_uint nbErrors( 0 );
    std::atomic_bool done( false );
    auto writer = [&]( int64_t base ) {
        for ( auto i = 0; i < nbTasks; ++i )
        {
            try
            {
                auto t = ms->getConn()->newTransaction();
                if ( ms->taskRegistry()->enqueue( request( base + i ) ) == false )
                    ++nbErrors;
                t->commit();
            }
            catch ( const sqlite::errors::Exception& )
            {
                ++nbErrors;
            }
        }
    };
    auto reader = [&]() {
        while ( done == false )
        {
            try
            {
                ms->pendingTasks();
            }
            catch ( const sqlite::errors::Exception& )
            {
                ++nbErrors;
            }
        }
    };
    std::thread r( reader );
    std::vector<std::thread> writers;
    for ( auto i = 0; i < nbThreads; ++i )
        writers.emplace_back( writer, ( i + 1 ) * 1000 );
    for ( auto& w : writers )
        w.join();
    done = true;
    r.join();
    ASSERT_EQ( 0u, nbErrors.load() );
    ASSERT_EQ( static_cast<size_t>( nbThreads * nbTasks ), ms->pending().size() );
}
