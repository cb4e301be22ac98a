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

#include <string>

#include "mediasync/Types.h"

namespace mediasync
{

class IFormatSelector
{
public:
    virtual ~IFormatSelector() = default;
    /**
     * @brief formatFor Returns the download format specification for the
     * media, or an empty string if none matches the source preferences.
     */
    virtual std::string formatFor( const IMedia& media, const ISource& source ) = 0;

    bool hasValidFormat( const IMedia& media, const ISource& source )
    {
        return formatFor( media, source ).empty() == false;
    }
};

}
