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

#include "mediasync/IFilterEngine.h"

namespace mediasync
{

/**
 * @brief The MediaFilter class applies a source's capture rules to a media
 *
 * A media is skipped when its upload date is unknown, when its title doesn't
 * pass the source's text filter, when it's older than the source's download
 * cap, or when its duration is out of the source's bounds.
 */
class MediaFilter : public IFilterEngine
{
public:
    virtual bool shouldSkip( const IMedia& media, const ISource& source ) override;
};

}
