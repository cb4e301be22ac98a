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

#pragma once

#include "gtest/gtest.h"

#include <ctime>

#include "common/MediaSyncTester.h"
#include "mocks/FileSystem.h"
#include "mocks/FilterEngine.h"
#include "mocks/FormatSelector.h"

class Tests : public testing::Test
{
protected:
    std::unique_ptr<MediaSyncTester> ms;
    std::shared_ptr<mock::FileSystem> fs;
    std::shared_ptr<mock::FilterEngine> filter;
    std::shared_ptr<mock::FormatSelector> formatSelector;

    virtual void SetUp() override;
    void Reload();
    virtual void TearDown() override;

    static MediaDescriptor descriptor( const std::string& title,
                                       const std::string& thumbnailUrl = {} );
};
