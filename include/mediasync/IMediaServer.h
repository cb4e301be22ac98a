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

/**
 * @brief The IMediaServer class represents an external library indexer which
 * must be told when media disappear.
 */
class IMediaServer
{
public:
    enum class Type : uint8_t
    {
        Plex,
        Jellyfin,
    };

    virtual ~IMediaServer() = default;

    virtual int64_t id() const = 0;
    virtual Type type() const = 0;
    virtual const std::string& host() const = 0;
    virtual uint16_t port() const = 0;
    virtual bool useHttps() const = 0;
    virtual bool verifyHttps() const = 0;
    virtual const std::string& options() const = 0;
    virtual std::string url() const = 0;

    virtual void setHttps( bool useHttps, bool verifyHttps ) = 0;
    virtual void setOptions( std::string options ) = 0;
    virtual bool save() = 0;
};

}
