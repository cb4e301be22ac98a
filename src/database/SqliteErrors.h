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

#include <sqlite3.h>

namespace mediasync
{

namespace sqlite
{
namespace errors
{

/**
 * Base type of every database error. It carries the extended sqlite result
 * code of the failed call.
 */
class Exception : public std::runtime_error
{
public:
    Exception( const std::string& msg, int extendedCode )
        : std::runtime_error( msg )
        , m_errorCode( extendedCode )
    {
    }

    Exception( const char* req, const char* errMsg, int extendedCode )
        : Exception( std::string{ "Failed to run request [" } + req + "]: " +
                     ( errMsg != nullptr ? errMsg : "" ) + " (" +
                     std::to_string( extendedCode ) + ")", extendedCode )
    {
    }

    int code() const
    {
        return m_errorCode & 0xFF;
    }

    int extendedCode() const
    {
        return m_errorCode;
    }

private:
    int m_errorCode;
};

class ConstraintViolation : public Exception
{
public:
    ConstraintViolation( const char* req, const char* errMsg, int extendedCode )
        : Exception( std::string{ "Request [" } + req + "] aborted due to "
                     "constraint violation (" + ( errMsg != nullptr ? errMsg : "" ) +
                     ")", extendedCode )
    {
    }
};

/*
 * Raised when inserting a second entity with the same key, or a second pending
 * task for the same (kind, target, extra) tuple.
 */
class ConstraintUnique : public ConstraintViolation
{
public:
    using ConstraintViolation::ConstraintViolation;
};

class ConstraintForeignKey : public ConstraintViolation
{
public:
    using ConstraintViolation::ConstraintViolation;
};

/*
 * SQLITE_BUSY & SQLITE_LOCKED: another connection, most likely from another
 * process, holds the database for longer than the busy timeout.
 */
class DatabaseBusy : public Exception
{
public:
    using Exception::Exception;
};

class ColumnOutOfRange : public Exception
{
public:
    ColumnOutOfRange( unsigned int idx, unsigned int nbColumns )
        : Exception( "Attempting to extract column at index " + std::to_string( idx ) +
                     " from a request with " + std::to_string( nbColumns ) +
                     " columns", SQLITE_RANGE )
    {
    }
};

/**
 * @brief isInnocuous Returns true for the errors the write helpers absorb:
 * they are caused by the environment, not by the request.
 */
static inline bool isInnocuous( int errCode )
{
    switch ( errCode )
    {
    case SQLITE_IOERR:
    case SQLITE_NOMEM:
    case SQLITE_BUSY:
    case SQLITE_READONLY:
    case SQLITE_FULL:
        return true;
    default:
        return false;
    }
}

static inline bool isInnocuous( const Exception& ex )
{
    return isInnocuous( ex.code() );
}

[[noreturn]] void mapToException( const char* reqStr, const char* errMsg, int extRes );

}
}
}
