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

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace mediasync
{

namespace sqlite
{

/*
 * Binds NULL for a 0 id, so an unset reference doesn't trip the foreign key
 * constraint.
 */
struct ForeignKey
{
    constexpr explicit ForeignKey( int64_t v ) : value( v ) {}
    int64_t value;
};

/*
 * Binds NULL for an empty string. Used for the optional file paths.
 */
struct NullableString
{
    explicit NullableString( std::string str ) : s( std::move( str ) ) {}
    std::string s;
};

template <typename T>
using Decay = typename std::decay<T>::type;

template <typename T>
using IsIntegerLike = std::integral_constant<bool,
    std::is_integral<Decay<T>>::value || std::is_enum<Decay<T>>::value>;

template <typename T, typename Enable = void>
struct Traits;

/*
 * Booleans, enums and integers up to 32 bits. Enums are stored as their
 * numerical value.
 */
template <typename T>
struct Traits<T, typename std::enable_if<IsIntegerLike<T>::value &&
                                         sizeof( Decay<T> ) <= sizeof( int )>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, Decay<T> value )
    {
        return sqlite3_bind_int( stmt, pos, static_cast<int>( value ) );
    }

    static Decay<T> Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<Decay<T>>( sqlite3_column_int( stmt, pos ) );
    }
};

/*
 * Ids, timestamps and any other 64 bits integer.
 */
template <typename T>
struct Traits<T, typename std::enable_if<IsIntegerLike<T>::value &&
                                         ( sizeof( Decay<T> ) > sizeof( int ) )>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, Decay<T> value )
    {
        return sqlite3_bind_int64( stmt, pos, static_cast<sqlite3_int64>( value ) );
    }

    static Decay<T> Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<Decay<T>>( sqlite3_column_int64( stmt, pos ) );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<std::is_same<Decay<T>, std::string>::value ||
                                         std::is_same<Decay<T>, const char*>::value ||
                                         std::is_same<Decay<T>, char*>::value>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, const std::string& value )
    {
        return sqlite3_bind_text( stmt, pos, value.c_str(), -1, SQLITE_TRANSIENT );
    }

    static std::string Load( sqlite3_stmt* stmt, int pos )
    {
        auto text = sqlite3_column_text( stmt, pos );
        if ( text == nullptr )
            return {};
        return reinterpret_cast<const char*>( text );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<std::is_same<Decay<T>, ForeignKey>::value>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, ForeignKey fk )
    {
        if ( fk.value == 0 )
            return sqlite3_bind_null( stmt, pos );
        return sqlite3_bind_int64( stmt, pos, fk.value );
    }
};

template <typename T>
struct Traits<T, typename std::enable_if<std::is_same<Decay<T>, NullableString>::value>::type>
{
    static int Bind( sqlite3_stmt* stmt, int pos, const NullableString& ns )
    {
        if ( ns.s.empty() == true )
            return sqlite3_bind_null( stmt, pos );
        return sqlite3_bind_text( stmt, pos, ns.s.c_str(), -1, SQLITE_TRANSIENT );
    }
};

}

}
