//----------------------------------------------------------------------------
//
// File:        support.cpp
// Date:        15-Jan-2003
// Programmer:  Marc Rousseau
//
// Description: File helpers shared by the tape utilities
//
// Copyright (c) 2003-2026 Marc Rousseau, All Rights Reserved.
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation; either version 2 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program; if not, write to the Free Software
// Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307, USA.
//
// Revision History:
//
//   15-Jan-2003    Renamed from original fileio.cpp
//   19-Oct-2026    Replaced the emulator search paths with whole-file I/O
//
//----------------------------------------------------------------------------

#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#if defined ( __GNUC__ )
    #include <unistd.h>
#endif
#include "common.hpp"
#include "logger.hpp"
#include "support.hpp"

DBG_REGISTER ( __FILE__ );

bool IsWriteable ( const char *filename )
{
    FUNCTION_ENTRY ( NULL, "IsWriteable", true );

    bool retVal = false;

    struct stat info;
    if ( stat ( filename, &info ) == 0 ) {
#if defined ( OS_WINDOWS )
        if ( info.st_mode & S_IWRITE ) retVal = true;
#else
        if ( getuid () == info.st_uid ) {
            if ( info.st_mode & S_IWUSR ) retVal = true;
        } else if ( getgid () == info.st_gid ) {
            if ( info.st_mode & S_IWGRP ) retVal = true;
        } else {
            if ( info.st_mode & S_IWOTH ) retVal = true;
        }
#endif
    } else {
        // TBD: Check write permissions to the directory
        retVal = true;
    }

    return retVal;
}

static bool TryFile ( const char *filename )
{
    FUNCTION_ENTRY ( NULL, "TryFile", true );

    DBG_TRACE ( "Name: " << filename );

    FILE *file = fopen ( filename, "rb" );
    if ( file != NULL ) {
        fclose ( file );
        return true;
    }

    return false;
}

const char *LocateFile ( const char *filename, const char *extension )
{
    FUNCTION_ENTRY ( NULL, "LocateFile", true );

    static char buffer [512];

    if ( filename == NULL ) return NULL;

    if ( TryFile ( filename ) == true ) return filename;

    if ( extension == NULL ) return NULL;

    snprintf ( buffer, sizeof ( buffer ), "%s%s", filename, extension );

    return ( TryFile ( buffer ) == true ) ? buffer : NULL;
}

bool LoadFile ( const char *filename, std::vector<UINT8> &buffer )
{
    FUNCTION_ENTRY ( NULL, "LoadFile", true );

    buffer.clear ();

    FILE *file = fopen ( filename, "rb" );
    if ( file == NULL ) {
        DBG_WARNING ( "Unable to open " << filename );
        return false;
    }

    const size_t CHUNK_SIZE = 512 * 1024;

    bool ok = true;
    size_t size = 0;

    for ( EVER ) {
        buffer.resize ( size + CHUNK_SIZE );
        size_t count = fread ( &buffer [size], 1, CHUNK_SIZE, file );
        size += count;
        if ( count < CHUNK_SIZE ) {
            if ( ferror ( file )) ok = false;
            break;
        }
    }

    fclose ( file );

    buffer.resize ( size );

    DBG_STATUS ( "Read " << size << " bytes from " << filename );

    return ok;
}

bool SaveFile ( const char *filename, const void *data, size_t size )
{
    FUNCTION_ENTRY ( NULL, "SaveFile", true );

    if ( IsWriteable ( filename ) == false ) {
        DBG_WARNING ( filename << " is not writeable" );
        return false;
    }

    FILE *file = fopen ( filename, "wb" );
    if ( file == NULL ) {
        DBG_WARNING ( "Unable to create " << filename );
        return false;
    }

    bool ok = true;
    if (( size > 0 ) && ( fwrite ( data, size, 1, file ) != 1 )) ok = false;
    if ( fclose ( file ) != 0 ) ok = false;

    return ok;
}

bool SaveFile ( const char *filename, const std::string &text )
{
    return SaveFile ( filename, text.data (), text.size ());
}
