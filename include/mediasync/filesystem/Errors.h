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

#include <stdexcept>
#include <string>
#include <system_error>

namespace mediasync
{

namespace fs
{

namespace errors
{

class Exception : public std::runtime_error
{
public:
    Exception( const std::string& str )
        : std::runtime_error( str )
    {
    }
};

class NotFound : public Exception
{
public:
    NotFound( const std::string& path, const std::string& container )
        : Exception( path + " was not found in " + container )
    {
    }
};

class System : public Exception
{
public:
    System( int err, const std::string& msg )
        : Exception( msg + ": " +
                     std::error_code( err, std::generic_category() ).message() )
        , m_errc( err, std::generic_category() )
    {
    }

    const std::error_code& code() const noexcept
    {
        return m_errc;
    }

private:
    std::error_code m_errc;
};

}

}

}
