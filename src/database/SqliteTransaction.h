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

#include <chrono>
#include <string>

#include "SqliteConnection.h"

namespace mediasync
{

namespace sqlite
{

/**
 * @brief The Transaction class is the interface of the objects returned by
 * Connection::newTransaction
 *
 * A transaction that isn't committed is rolled back upon destruction.
 */
class Transaction
{
public:
    Transaction() = default;
    virtual ~Transaction() = default;
    virtual void commit() = 0;

    /**
     * @brief isInProgress Returns true if the calling thread runs a transaction
     */
    static bool isInProgress();

    Transaction( const Transaction& ) = delete;
    Transaction( Transaction&& ) = delete;
    Transaction& operator=( const Transaction& ) = delete;
    Transaction& operator=( Transaction&& ) = delete;

protected:
    static thread_local Transaction* CurrentTransaction;
};

/**
 * @brief The ActualTransaction class holds the connection's write context for
 * its whole lifetime
 *
 * Every other thread waits for the transaction to be committed or rolled back
 * before it can use the connection.
 */
class ActualTransaction : public Transaction
{
public:
    explicit ActualTransaction( sqlite::Connection* dbConn );
    virtual ~ActualTransaction();
    virtual void commit() override;

private:
    void execute( const std::string& req );

private:
    Connection::WriteContext m_ctx;
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief The NoopTransaction class is returned for nested transactions, which
 * join the one already running on the calling thread
 */
class NoopTransaction : public Transaction
{
public:
    NoopTransaction();
    virtual void commit() override;
};

}

}
