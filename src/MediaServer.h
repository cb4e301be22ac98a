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

#include "mediasync/IMediaServer.h"
#include "database/DatabaseHelpers.h"

namespace mediasync
{

class MediaServer : public IMediaServer, public DatabaseHelpers<MediaServer>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
        static int64_t MediaServer::*const PrimaryKey;
    };

    MediaServer( MediaSyncPtr ml, sqlite::Row& row );
    MediaServer( MediaSyncPtr ml, Type type, std::string host, uint16_t port );

    static void createTable( sqlite::Connection* dbConnection );
    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static bool checkDbModel( MediaSyncPtr ml );
    static bool remove( MediaSyncPtr ml, int64_t serverId );

    virtual int64_t id() const override;
    virtual Type type() const override;
    virtual const std::string& host() const override;
    virtual uint16_t port() const override;
    virtual bool useHttps() const override;
    virtual bool verifyHttps() const override;
    virtual const std::string& options() const override;
    virtual std::string url() const override;

    virtual void setHttps( bool useHttps, bool verifyHttps ) override;
    virtual void setOptions( std::string options ) override;
    virtual bool save() override;

private:
    MediaSyncPtr m_ml;

    int64_t m_id;
    const Type m_type;
    const std::string m_host;
    const uint16_t m_port;
    bool m_useHttps;
    bool m_verifyHttps;
    std::string m_options;

    bool m_changed;

    friend struct MediaServer::Table;
};

}
