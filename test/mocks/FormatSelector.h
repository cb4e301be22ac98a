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

#include <set>
#include <string>

#include "mediasync/IFormatSelector.h"
#include "mediasync/IMedia.h"

namespace mock
{

/**
 * Returns a format for every media, except the ones whose key was listed as
 * having none.
 */
class FormatSelector : public mediasync::IFormatSelector
{
public:
    virtual std::string formatFor( const mediasync::IMedia& media,
                                   const mediasync::ISource& ) override
    {
        if ( noFormatKeys.find( media.key() ) != end( noFormatKeys ) )
            return {};
        return "137+251";
    }

    std::set<std::string> noFormatKeys;
};

}
