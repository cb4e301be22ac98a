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

class MediaRules
{
public:
    explicit MediaRules( MediaSyncPtr ml );

    /**
     * @brief derive Recomputes the flags derived from the media state before
     * it gets written.
     *
     * The skip and can_download flags are refreshed using the filter engine
     * and the format selector, and file references pointing to missing files
     * are dropped. Nothing is modified unless every query succeeded. Manually
     * skipped media are left untouched.
     */
    void derive( Media& media );
    /**
     * @brief schedule Schedules the tasks the media still needs: metadata,
     * thumbnail and media download, in this order.
     */
    void schedule( Media& media );
    void onBeforeDelete( Media& media );
    void onAfterDelete( Media& media );

private:
    MediaSyncPtr m_ml;
};

}

}
