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

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "mediasync/filesystem/IFileSystem.h"

namespace mock
{

/**
 * In memory file system. Paths are stored verbatim, no directory is implied.
 */
class FileSystem : public mediasync::fs::IFileSystem
{
public:
    void addFile( const std::string& path )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_files.insert( path );
    }

    void removeFile( const std::string& path )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_files.erase( path );
    }

    virtual bool fileExists( const std::string& path ) const override
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_files.find( path ) != end( m_files );
    }

    virtual std::vector<std::string> listFilesMatching( const std::string& stem ) const override
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        std::vector<std::string> res;
        const auto prefix = stem + '.';
        for ( const auto& f : m_files )
        {
            if ( f.compare( 0, prefix.size(), prefix ) != 0 )
                continue;
            // Don't match files in a subfolder
            if ( f.find( '/', prefix.size() ) != std::string::npos )
                continue;
            res.push_back( f );
        }
        return res;
    }

    virtual bool remove( const std::string& path ) override
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        removed.push_back( path );
        return m_files.erase( path ) > 0;
    }

    std::vector<std::string> removed;

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_files;
};

}
