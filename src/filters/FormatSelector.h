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

#include "mediasync/IFormatSelector.h"

namespace mediasync
{

/**
 * @brief The FormatSelector class picks the format matching a source's
 * preferences among the ones available for a media.
 *
 * The result follows the downloader's format specification syntax: a single
 * format id, or "<video id>+<audio id>" when the video format carries no
 * audio.
 */
class FormatSelector : public IFormatSelector
{
public:
    virtual std::string formatFor( const IMedia& media, const ISource& source ) override;
};

}
