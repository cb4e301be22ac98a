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

#include "FileSystem.h"
#include "logging/Logger.h"
#include "utils/Filename.h"
#include "utils/File.h"
#include "mediasync/filesystem/Errors.h"

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <memory>
#include <sys/stat.h>

namespace mediasync
{

namespace fs
{

bool LocalFileSystem::fileExists( const std::string& path ) const
{
    if ( path.empty() == true )
        return false;
    return utils::fs::exists( path );
}

std::vector<std::string> LocalFileSystem::listFilesMatching( const std::string& stem ) const
{
    auto dirPath = utils::file::directory( stem );
    if ( dirPath.empty() == true )
        dirPath = "./";
    const auto prefix = utils::file::fileName( stem ) + '.';

    std::vector<std::string> files;
    std::unique_ptr<DIR, int(*)(DIR*)> dir( opendir( dirPath.c_str() ), closedir );
    if ( dir == nullptr )
    {
        if ( errno == ENOENT )
            return files;
        LOG_ERROR( "Failed to open directory ", dirPath );
        throw errors::System( errno, "Failed to open directory" );
    }

    dirent* result = nullptr;
    while ( ( result = readdir( dir.get() ) ) != nullptr )
    {
        if ( strncmp( result->d_name, prefix.c_str(), prefix.size() ) != 0 )
            continue;
        std::string path = utils::file::toFolderPath( dirPath ) + result->d_name;
        struct stat s;
        if ( lstat( path.c_str(), &s ) != 0 )
        {
            if ( errno == ENOENT || errno == EACCES )
            {
                LOG_WARN( "Ignoring ", path, ": ", strerror( errno ) );
                continue;
            }
            LOG_ERROR( "Failed to get file ", path, " info" );
            throw errors::System{ errno, "Failed to get file info" };
        }
        if ( S_ISDIR( s.st_mode ) )
            continue;
        files.push_back( std::move( path ) );
    }
    return files;
}

bool LocalFileSystem::remove( const std::string& path )
{
    if ( utils::fs::remove( path ) == true )
        return true;
    LOG_WARN( "Failed to remove ", path, ": ", strerror( errno ) );
    return false;
}

}

}
