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

#ifndef MEDIASYNC_SETTINGS_H
#define MEDIASYNC_SETTINGS_H

#include "Types.h"
#include <cstdint>

namespace mediasync
{

namespace sqlite
{
class Connection;
}

class Settings
{
public:
    explicit Settings( MediaSync* ml );
    bool load();
    /**
     * @brief dbModelVersion returns the current database model version.
     *
     * This is 0 until the tables were created for the first time
     */
    uint32_t dbModelVersion() const;
    bool setDbModelVersion( uint32_t dbModelVersion );
    uint32_t maxTaskAttempts() const;
    bool setMaxTaskAttempts( uint32_t maxTaskAttempts );
    uint32_t retryBaseDelay() const;
    bool setRetryBaseDelay( uint32_t delay );
    bool escalateThumbnailFailures() const;
    bool setEscalateThumbnailFailures( bool escalate );
    bool escalateDownloadFailures() const;
    bool setEscalateDownloadFailures( bool escalate );

    static void createTable( sqlite::Connection* dbConn );

    static const uint32_t DbModelVersion;
    static const uint32_t MaxTaskAttempts;
    static const uint32_t RetryBaseDelay;

private:
    template <typename T>
    bool update( const char* column, T& member, T value );

private:
    MediaSync* m_ml;

    uint32_t m_dbModelVersion;
    uint32_t m_maxTaskAttempts;
    uint32_t m_retryBaseDelay;
    bool m_escalateThumbnailFailures;
    bool m_escalateDownloadFailures;
};

}

#endif // MEDIASYNC_SETTINGS_H
