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

#include <atomic>
#include <set>
#include <stdexcept>
#include <string>

#include "mediasync/IFilterEngine.h"
#include "mediasync/IMedia.h"

namespace mock
{

/**
 * Skips the media whose key was flagged, and counts its invocations.
 */
class FilterEngine : public mediasync::IFilterEngine
{
public:
    FilterEngine()
        : throws( false )
        , nbCalls( 0 )
    {
    }

    virtual bool shouldSkip( const mediasync::IMedia& media,
                             const mediasync::ISource& ) override
    {
        ++nbCalls;
        if ( throws == true )
            throw std::runtime_error( "filter failure" );
        return skippedKeys.find( media.key() ) != end( skippedKeys );
    }

    std::set<std::string> skippedKeys;
    bool throws;
    std::atomic_uint nbCalls;
};

}
