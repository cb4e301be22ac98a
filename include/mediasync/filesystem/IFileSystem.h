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

#include <string>
#include <vector>

namespace mediasync
{

namespace fs
{

/**
 * @brief The IFileSystem class exposes the few filesystem operations the
 * lifecycle rules need.
 */
class IFileSystem
{
public:
    virtual ~IFileSystem() = default;
    virtual bool fileExists( const std::string& path ) const = 0;
    /**
     * @brief listFilesMatching Lists the files named <stem>.<anything>
     * @param stem A path without extension
     * @return The full path of every matching file
     */
    virtual std::vector<std::string> listFilesMatching( const std::string& stem ) const = 0;
    virtual bool remove( const std::string& path ) = 0;
};

}

}
