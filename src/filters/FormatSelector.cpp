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

#include "FormatSelector.h"

#include "mediasync/IMedia.h"
#include "mediasync/ISource.h"
#include "logging/Logger.h"

#include <cstring>

namespace mediasync
{

namespace
{

bool startsWith( const std::string& str, const char* prefix )
{
    return str.compare( 0, strlen( prefix ), prefix ) == 0;
}

bool matchesCodec( const FormatDescriptor& f, ISource::VideoCodec codec )
{
    switch ( codec )
    {
        case ISource::VideoCodec::AVC1:
            return startsWith( f.videoCodec, "avc1" );
        case ISource::VideoCodec::VP9:
            return startsWith( f.videoCodec, "vp9" ) || startsWith( f.videoCodec, "vp09" );
        default:
            return false;
    }
}

bool matchesCodec( const FormatDescriptor& f, ISource::AudioCodec codec )
{
    switch ( codec )
    {
        case ISource::AudioCodec::MP4A:
            return startsWith( f.audioCodec, "mp4a" );
        case ISource::AudioCodec::OPUS:
            return startsWith( f.audioCodec, "opus" );
        default:
            return false;
    }
}

bool isAudioOnly( const FormatDescriptor& f )
{
    return f.height == 0 && f.videoCodec.empty() == true &&
            f.audioCodec.empty() == false;
}

bool isVideo( const FormatDescriptor& f )
{
    return f.height > 0 && f.videoCodec.empty() == false;
}

const FormatDescriptor* selectAudio( const std::vector<FormatDescriptor>& formats,
                                     const ISource& source )
{
    const FormatDescriptor* fallback = nullptr;
    for ( const auto& f : formats )
    {
        if ( isAudioOnly( f ) == false )
            continue;
        if ( matchesCodec( f, source.audioCodec() ) == true )
            return &f;
        if ( fallback == nullptr )
            fallback = &f;
    }
    if ( source.fallback() == ISource::Fallback::Fail )
        return nullptr;
    return fallback;
}

/*
 * Returns true if a is a better candidate than b, b being the best candidate
 * so far, or nullptr.
 * When looking below the requested height, the highest format wins, otherwise
 * the lowest does. Equal heights are decided by the codec, then by the
 * framerate preference.
 */
bool isBetter( const FormatDescriptor& a, const FormatDescriptor* b,
               bool below, const ISource& source )
{
    if ( b == nullptr )
        return true;
    if ( a.height != b->height )
        return below == true ? a.height > b->height : a.height < b->height;
    auto aCodec = matchesCodec( a, source.videoCodec() );
    auto bCodec = matchesCodec( *b, source.videoCodec() );
    if ( aCodec != bCodec )
        return aCodec;
    if ( source.prefer60fps() == true )
        return a.fps >= 60 && b->fps < 60;
    return false;
}

const FormatDescriptor* selectVideo( const std::vector<FormatDescriptor>& formats,
                                     const ISource& source )
{
    const auto requested = static_cast<uint32_t>( source.resolution() );
    const FormatDescriptor* exact = nullptr;
    for ( const auto& f : formats )
    {
        if ( isVideo( f ) == false || f.height != requested ||
             matchesCodec( f, source.videoCodec() ) == false )
            continue;
        if ( exact == nullptr ||
             ( source.prefer60fps() == true && f.fps >= 60 && exact->fps < 60 ) )
            exact = &f;
    }
    if ( exact != nullptr || source.fallback() == ISource::Fallback::Fail )
        return exact;

    const auto minHeight = source.fallback() == ISource::Fallback::NextBestHd ?
                static_cast<uint32_t>( ISource::Resolution::P720 ) : 1u;
    const FormatDescriptor* below = nullptr;
    const FormatDescriptor* above = nullptr;
    for ( const auto& f : formats )
    {
        if ( isVideo( f ) == false || f.height < minHeight )
            continue;
        if ( f.height < requested )
        {
            if ( isBetter( f, below, true, source ) == true )
                below = &f;
        }
        else if ( isBetter( f, above, false, source ) == true )
        {
            above = &f;
        }
    }
    return below != nullptr ? below : above;
}

}

std::string FormatSelector::formatFor( const IMedia& media, const ISource& source )
{
    auto metadata = media.metadata();
    if ( metadata == nullptr || metadata->formats.empty() == true )
        return {};
    const auto& formats = metadata->formats;
    if ( source.resolution() == ISource::Resolution::Audio )
    {
        auto audio = selectAudio( formats, source );
        if ( audio == nullptr )
        {
            LOG_DEBUG( "No audio format available for ", media.key() );
            return {};
        }
        return audio->formatId;
    }
    auto video = selectVideo( formats, source );
    if ( video == nullptr )
    {
        LOG_DEBUG( "No video format matching ", static_cast<int>( source.resolution() ),
                   "p available for ", media.key() );
        return {};
    }
    if ( video->audioCodec.empty() == false )
        return video->formatId;
    auto audio = selectAudio( formats, source );
    if ( audio == nullptr )
    {
        LOG_DEBUG( "No audio format to merge with ", video->formatId, " for ",
                   media.key() );
        return {};
    }
    return video->formatId + '+' + audio->formatId;
}

}
