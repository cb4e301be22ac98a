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

#include "MediaFilter.h"

#include "mediasync/IMedia.h"
#include "mediasync/ISource.h"
#include "logging/Logger.h"

#include <ctime>
#include <regex>

namespace mediasync
{

bool MediaFilter::shouldSkip( const IMedia& media, const ISource& source )
{
    auto metadata = media.metadata();
    if ( metadata == nullptr )
        return false;
    if ( metadata->uploadDate == 0 )
    {
        LOG_DEBUG( "Skipping ", media.key(), ": unknown upload date" );
        return true;
    }
    const auto& filterText = source.filterText();
    if ( filterText.empty() == false )
    {
        try
        {
            std::regex pattern{ filterText, std::regex_constants::ECMAScript };
            auto matches = std::regex_search( media.title(), pattern );
            if ( matches == source.filterTextInvert() )
            {
                LOG_DEBUG( "Skipping ", media.key(), ": title \"", media.title(),
                           "\" doesn't pass filter \"", filterText, '"' );
                return true;
            }
        }
        catch ( const std::regex_error& ex )
        {
            LOG_WARN( "Ignoring invalid filter \"", filterText, "\" for source ",
                      source.name(), ": ", ex.what() );
        }
    }
    if ( source.downloadCap() > 0 )
    {
        auto oldest = static_cast<int64_t>( time( nullptr ) ) - source.downloadCap();
        if ( metadata->uploadDate < oldest )
        {
            LOG_DEBUG( "Skipping ", media.key(), ": published before the download cap" );
            return true;
        }
    }
    if ( metadata->duration > 0 )
    {
        if ( ( source.minDuration() > 0 && metadata->duration < source.minDuration() ) ||
             ( source.maxDuration() > 0 && metadata->duration > source.maxDuration() ) )
        {
            LOG_DEBUG( "Skipping ", media.key(), ": duration ", metadata->duration,
                       "s is out of bounds" );
            return true;
        }
    }
    return false;
}

}
