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

#include "SqliteErrors.h"

namespace mediasync
{
namespace sqlite
{
namespace errors
{

void mapToException( const char* reqStr, const char* errMsg, int extRes )
{
    switch ( extRes & 0xFF )
    {
        case SQLITE_CONSTRAINT:
            if ( extRes == SQLITE_CONSTRAINT_UNIQUE ||
                 extRes == SQLITE_CONSTRAINT_PRIMARYKEY )
                throw ConstraintUnique( reqStr, errMsg, extRes );
            if ( extRes == SQLITE_CONSTRAINT_FOREIGNKEY )
                throw ConstraintForeignKey( reqStr, errMsg, extRes );
            throw ConstraintViolation( reqStr, errMsg, extRes );
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw DatabaseBusy( reqStr, errMsg, extRes );
        default:
            throw Exception( reqStr, errMsg, extRes );
    }
}

}
}
}
