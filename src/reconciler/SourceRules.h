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

#include "Types.h"

namespace mediasync
{

namespace reconciler
{

class SourceRules
{
public:
    explicit SourceRules( MediaSyncPtr ml );

    /**
     * @brief onBeforeUpdate Replaces the indexing task when the schedule changed
     * @param previous The currently persisted source, or nullptr if it is gone
     */
    void onBeforeUpdate( Source& source, const Source* previous );
    void onAfterCreate( Source& source );
    /**
     * @brief onAfterSave Schedules a pass over every media of the source so
     * they pick up its new settings
     */
    void onAfterSave( Source& source );
    void onBeforeDelete( Source& source );
    void onAfterDelete( Source& source );

private:
    void scheduleIndexing( const Source& source );

private:
    MediaSyncPtr m_ml;
};

}

}
