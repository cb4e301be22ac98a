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

#include <benchmark/benchmark.h>
#include "mediasync/IMediaSync.h"
#include "mediasync/ITaskRegistry.h"

#include <memory>
#include <stdexcept>
#include <unistd.h>

using namespace mediasync;

namespace
{

struct BenchMediaSync
{
    BenchMediaSync()
    {
        unlink( "bench.db" );
        ms.reset( NewMediaSync() );
        if ( ms->initialize( "bench.db", nullptr ) != InitializeResult::Success )
            throw std::runtime_error( "Failed to initialize the benchmark database" );
    }

    ~BenchMediaSync()
    {
        ms.reset();
        unlink( "bench.db" );
    }

    std::unique_ptr<IMediaSync> ms;
};

TaskRequest downloadRequest( int64_t mediaId )
{
    return TaskRequest{ ITask::Kind::DownloadMedia, mediaId, {}, priority::Download,
                        "1", 0, "Downloading media", true };
}

}

static void BenchEnqueue( benchmark::State& state )
{
    BenchMediaSync bms;
    auto registry = bms.ms->taskRegistry();
    int64_t i = 0;
    for ( auto _ : state )
    {
        // Cycle through a bounded set of keys so most calls replace a task
        auto res = registry->enqueue( downloadRequest( ++i % state.range( 0 ) + 1 ) );
        benchmark::DoNotOptimize( res );
    }
}

static void BenchDispatch( benchmark::State& state )
{
    BenchMediaSync bms;
    auto registry = bms.ms->taskRegistry();
    for ( auto _ : state )
    {
        state.PauseTiming();
        for ( auto i = 0; i < state.range( 0 ); ++i )
        {
            if ( registry->enqueue( downloadRequest( i + 1 ) ) == false )
            {
                state.SkipWithError( "Failed to enqueue" );
                return;
            }
        }
        state.ResumeTiming();
        while ( auto t = bms.ms->nextTask( "1" ) )
        {
            if ( bms.ms->taskCompleted( t->id() ) == false )
            {
                state.SkipWithError( "Failed to complete a task" );
                return;
            }
        }
    }
}

static void BenchMediaSave( benchmark::State& state )
{
    BenchMediaSync bms;
    auto s = bms.ms->newSource( ISource::Type::Channel, "UCbench", "bench", "/tmp" );
    if ( s->save() == false )
    {
        state.SkipWithError( "Failed to create the source" );
        return;
    }
    auto m = bms.ms->newMedia( s->id(), "media" );
    MediaDescriptor desc;
    desc.title = "title";
    desc.uploadDate = 1;
    m->setMetadata( desc );
    if ( m->save() == false )
    {
        state.SkipWithError( "Failed to create the media" );
        return;
    }
    for ( auto _ : state )
    {
        auto res = m->save();
        benchmark::DoNotOptimize( res );
    }
}

BENCHMARK( BenchEnqueue )->Arg( 1 )->Arg( 100 );
BENCHMARK( BenchDispatch )->Arg( 10 )->Arg( 100 );
BENCHMARK( BenchMediaSave );

BENCHMARK_MAIN();
