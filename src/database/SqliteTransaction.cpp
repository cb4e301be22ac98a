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

#include "SqliteTransaction.h"

#include "SqliteTools.h"

namespace mediasync
{

namespace sqlite
{

thread_local Transaction* Transaction::CurrentTransaction = nullptr;

bool Transaction::isInProgress()
{
    return CurrentTransaction != nullptr;
}

ActualTransaction::ActualTransaction( sqlite::Connection* dbConn )
    : m_ctx( dbConn->acquireWriteContext() )
    , m_start( std::chrono::steady_clock::now() )
{
    assert( CurrentTransaction == nullptr );
    execute( "BEGIN" );
    CurrentTransaction = this;
}

ActualTransaction::~ActualTransaction()
{
    if ( CurrentTransaction != this )
        return;
    CurrentTransaction = nullptr;
    try
    {
        execute( "ROLLBACK" );
    }
    // A failed rollback is most likely innocuous, sqlite may already have
    // rolled back on its own (see http://www.sqlite.org/lang_transaction.html)
    catch ( const errors::Exception& ex )
    {
        LOG_WARN( "Failed to rollback transaction: ", ex.what() );
    }
}

void ActualTransaction::commit()
{
    assert( CurrentTransaction == this );
    execute( "COMMIT" );
    CurrentTransaction = nullptr;
    auto duration = std::chrono::steady_clock::now() - m_start;
    LOG_VERBOSE( "Committed transaction after ",
                 std::chrono::duration_cast<std::chrono::microseconds>( duration ).count(),
                 "µs" );
    m_ctx.unlock();
}

void ActualTransaction::execute( const std::string& req )
{
    // The handle is shared between threads: the statement has to be reset
    // before the write context is released.
    Statement s( m_ctx.handle(), req );
    s.execute();
    while ( s.row() != nullptr )
        ;
}

NoopTransaction::NoopTransaction()
{
    assert( Transaction::isInProgress() == true );
}

void NoopTransaction::commit()
{
}

}

}
