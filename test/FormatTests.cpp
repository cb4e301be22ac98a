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

#include "filters/FormatSelector.h"

class Formats : public Tests
{
protected:
    std::unique_ptr<Source> source;
    std::unique_ptr<Media> media;
    FormatSelector selector;

    virtual void SetUp() override
    {
        Tests::SetUp();
        source.reset( new Source( ms.get(), ISource::Type::Channel, "UCxyz",
                                  "channel", "/downloads" ) );
        media.reset( new Media( ms.get(), 1, "media1" ) );
    }

    void setFormats( std::vector<FormatDescriptor> formats )
    {
        MediaDescriptor desc;
        desc.title = "title";
        desc.uploadDate = time( nullptr );
        desc.formats = std::move( formats );
        media->setMetadata( std::move( desc ) );
    }

    void setPreferences( ISource::Resolution res, ISource::Fallback fallback,
                         bool prefer60fps = false )
    {
        source->setFormatPreferences( res, ISource::VideoCodec::VP9,
                                      ISource::AudioCodec::OPUS, prefer60fps,
                                      fallback );
    }

    static FormatDescriptor video( const std::string& id, uint32_t height,
                                   const std::string& codec = "vp9", uint32_t fps = 30 )
    {
        return FormatDescriptor{ id, height, fps, codec, "" };
    }

    static FormatDescriptor audio( const std::string& id, const std::string& codec )
    {
        return FormatDescriptor{ id, 0, 0, "", codec };
    }
};

TEST_F( Formats, NoFormats )
{
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );
    setFormats( {} );
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );
    ASSERT_FALSE( selector.hasValidFormat( *media, *source ) );
}

TEST_F( Formats, Exact )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::Fail );
    setFormats( { audio( "140", "mp4a.40.2" ), audio( "251", "opus" ),
                  video( "137", 1080, "avc1.640028" ), video( "248", 1080, "vp9" ),
                  video( "247", 720, "vp9" ) } );
    ASSERT_EQ( "248+251", selector.formatFor( *media, *source ) );
    ASSERT_TRUE( selector.hasValidFormat( *media, *source ) );
}

TEST_F( Formats, Prefer60fps )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::Fail, true );
    setFormats( { audio( "251", "opus" ), video( "248", 1080, "vp09.00.40.08" ),
                  video( "303", 1080, "vp09.00.41.08", 60 ) } );
    ASSERT_EQ( "303+251", selector.formatFor( *media, *source ) );

    setPreferences( ISource::Resolution::P1080, ISource::Fallback::Fail, false );
    ASSERT_EQ( "248+251", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, CombinedFormat )
{
    setPreferences( ISource::Resolution::P360, ISource::Fallback::Fail );
    setFormats( { FormatDescriptor{ "18", 360, 30, "vp9", "opus" } } );
    ASSERT_EQ( "18", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, AudioOnly )
{
    setPreferences( ISource::Resolution::Audio, ISource::Fallback::Fail );
    setFormats( { video( "248", 1080 ), audio( "140", "mp4a.40.2" ), audio( "251", "opus" ) } );
    ASSERT_EQ( "251", selector.formatFor( *media, *source ) );

    setFormats( { video( "248", 1080 ), audio( "140", "mp4a.40.2" ) } );
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );
    setPreferences( ISource::Resolution::Audio, ISource::Fallback::NextBest );
    ASSERT_EQ( "140", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, NoAudioToMerge )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::NextBest );
    setFormats( { video( "248", 1080 ) } );
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, FallbackFail )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::Fail );
    setFormats( { audio( "251", "opus" ), video( "247", 720 ), video( "271", 1440 ),
                  video( "137", 1080, "avc1.640028" ) } );
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, FallbackNextBest )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::NextBest );
    setFormats( { audio( "251", "opus" ), video( "243", 360 ), video( "247", 720 ),
                  video( "271", 1440 ) } );
    // The closest lower resolution is preferred
    ASSERT_EQ( "247+251", selector.formatFor( *media, *source ) );

    setFormats( { audio( "251", "opus" ), video( "271", 1440 ), video( "313", 2160 ) } );
    ASSERT_EQ( "271+251", selector.formatFor( *media, *source ) );

    setFormats( { audio( "251", "opus" ), video( "243", 360 ) } );
    ASSERT_EQ( "243+251", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, FallbackCodec )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::NextBest );
    setFormats( { audio( "251", "opus" ), video( "137", 1080, "avc1.640028" ),
                  video( "247", 720, "vp9" ), video( "136", 720, "avc1.4d401f" ) } );
    // Same height, the preferred codec wins
    ASSERT_EQ( "247+251", selector.formatFor( *media, *source ) );

    setFormats( { audio( "251", "opus" ), video( "137", 1080, "avc1.640028" ) } );
    ASSERT_EQ( "137+251", selector.formatFor( *media, *source ) );
}

TEST_F( Formats, FallbackNextBestHd )
{
    setPreferences( ISource::Resolution::P1080, ISource::Fallback::NextBestHd );
    setFormats( { audio( "251", "opus" ), video( "243", 360 ), video( "244", 480 ) } );
    ASSERT_EQ( "", selector.formatFor( *media, *source ) );

    setFormats( { audio( "251", "opus" ), video( "244", 480 ), video( "247", 720 ) } );
    ASSERT_EQ( "247+251", selector.formatFor( *media, *source ) );

    setFormats( { audio( "251", "opus" ), video( "244", 480 ), video( "271", 1440 ) } );
    ASSERT_EQ( "271+251", selector.formatFor( *media, *source ) );
}
