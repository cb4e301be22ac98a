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

namespace mediasync
{

namespace utils
{

namespace file
{
    /**
     * @brief stripExtension Returns the path without its extension
     *
     * Dots found in the directory part of the path are left alone.
     */
    std::string stripExtension( const std::string& fileName );
    /**
     * @brief directory Returns the path of the folder containing the provided file
     * @param filePath A path pointing to a file
     * If the path points to a directory, this function will return the same path.
     */
    std::string directory( const std::string& filePath );
    std::string fileName( const std::string& filePath );
    /**
     * @brief toFolderPath  Ensures a path is a folder path; ie. it has a terminal '/'
     * @param path          The path to sanitize
     */
    std::string toFolderPath( std::string path );
}

}

}
