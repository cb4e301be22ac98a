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

#include <ctime>
#include <unistd.h>

class TestEnv : public ::testing::Environment
{
    public:
        virtual void SetUp()
        {
            // Always clean the DB in case a previous test crashed
            unlink("test.db");
        }
};

void Tests::TearDown()
{
    ms.reset();
    unlink("test.db");
}

void Tests::Reload()
{
    ms.reset( new MediaSyncTester );
    SetupConfig cfg;
    cfg.logLevel = LogLevel::Error;
    cfg.fileSystem = fs;
    cfg.filterEngine = filter;
    cfg.formatSelector = formatSelector;
    auto res = ms->initialize( "test.db", &cfg );
    ASSERT_EQ( InitializeResult::Success, res );
}

void Tests::SetUp()
{
    fs = std::make_shared<mock::FileSystem>();
    filter = std::make_shared<mock::FilterEngine>();
    formatSelector = std::make_shared<mock::FormatSelector>();
    Reload();
}

MediaDescriptor Tests::descriptor( const std::string& title, const std::string& thumbnailUrl )
{
    MediaDescriptor desc;
    desc.title = title;
    desc.uploadDate = time( nullptr ) - 3600;
    desc.duration = 600;
    desc.thumbnailUrl = thumbnailUrl;
    desc.formats.push_back( FormatDescriptor{ "137", 1080, 30, "avc1.640028", "" } );
    desc.formats.push_back( FormatDescriptor{ "251", 0, 0, "", "opus" } );
    return desc;
}

::testing::Environment* const env = ::testing::AddGlobalTestEnvironment(new TestEnv);
