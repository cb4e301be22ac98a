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

#include <memory>
#include <vector>

#include "SqliteTools.h"
#include "SqliteTransaction.h"

namespace mediasync
{

/**
 * @brief The DatabaseHelpers class provides the row mapping boilerplate of the
 * entities
 *
 * IMPL must expose a Table struct with the table Name, its PrimaryKeyColumn
 * and a PrimaryKey member pointer, and a (MediaSyncPtr, sqlite::Row&)
 * constructor.
 * Reads absorb innocuous errors and return an empty result. Any other error
 * propagates.
 */
template <typename IMPL>
class DatabaseHelpers
{
public:
    static std::shared_ptr<IMPL> fetch( MediaSyncPtr ml, int64_t pkValue )
    {
        static const std::string req = "SELECT * FROM " + IMPL::Table::Name +
                " WHERE " + IMPL::Table::PrimaryKeyColumn + " = ?";
        return fetch( ml, req, pkValue );
    }

    template <typename... Args>
    static std::shared_ptr<IMPL> fetch( MediaSyncPtr ml, const std::string& req,
                                        Args&&... args )
    {
        return readOrDefault( [&]() {
            return sqlite::Tools::fetchOne<IMPL>( ml, req, std::forward<Args>( args )... );
        });
    }

    template <typename INTF = IMPL>
    static std::vector<std::shared_ptr<INTF>> fetchAll( MediaSyncPtr ml )
    {
        static const std::string req = "SELECT * FROM " + IMPL::Table::Name +
                " ORDER BY " + IMPL::Table::PrimaryKeyColumn;
        return fetchAll<INTF>( ml, req );
    }

    template <typename INTF, typename... Args>
    static std::vector<std::shared_ptr<INTF>> fetchAll( MediaSyncPtr ml,
                                                        const std::string& req,
                                                        Args&&... args )
    {
        return readOrDefault( [&]() {
            return sqlite::Tools::fetchAll<IMPL, INTF>( ml, req,
                                                        std::forward<Args>( args )... );
        });
    }

    static bool destroy( MediaSyncPtr ml, int64_t pkValue )
    {
        static const std::string req = "DELETE FROM " + IMPL::Table::Name +
                " WHERE " + IMPL::Table::PrimaryKeyColumn + " = ?";
        return sqlite::Tools::executeDelete( ml->getConn(), req, pkValue );
    }

protected:
    /*
     * Inserts the row and stores the new primary key in self
     */
    template <typename... Args>
    static bool insert( MediaSyncPtr ml, IMPL& self, const std::string& req,
                        Args&&... args )
    {
        auto pKey = sqlite::Tools::executeInsert( ml->getConn(), req,
                                                  std::forward<Args>( args )... );
        if ( pKey == 0 )
            return false;
        self.*IMPL::Table::PrimaryKey = pKey;
        return true;
    }

private:
    template <typename Func>
    static auto readOrDefault( Func f ) -> decltype( f() )
    {
        try
        {
            return f();
        }
        catch ( const sqlite::errors::Exception& ex )
        {
            if ( sqlite::errors::isInnocuous( ex ) == false )
                throw;
            LOG_WARN( "Ignoring innocuous error: ", ex.what() );
        }
        return {};
    }
};

}
